#pragma once

#include <wrapcoin/controller/controller.hpp>
#include <wrapcoin/controller/error.hpp>
#include <wrapcoin/controller/program_registry.hpp>
#include <wrapcoin/controller/state.hpp>
