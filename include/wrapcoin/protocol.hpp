#pragma once

#include <wrapcoin/protocol/account.hpp>
#include <wrapcoin/protocol/program.hpp>
#include <wrapcoin/protocol/transaction.hpp>
