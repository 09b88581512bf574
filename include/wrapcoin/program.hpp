#pragma once

#include <wrapcoin/program/coin.hpp>
#include <wrapcoin/program/custody.hpp>
#include <wrapcoin/program/error.hpp>
#include <wrapcoin/program/io.hpp>
#include <wrapcoin/program/program.hpp>
#include <wrapcoin/program/system_interface.hpp>
#include <wrapcoin/program/token.hpp>
#include <wrapcoin/program/wrapper.hpp>
