#pragma once

#include <wrapcoin/state_db/database.hpp>
#include <wrapcoin/state_db/state_delta.hpp>
#include <wrapcoin/state_db/state_node.hpp>
#include <wrapcoin/state_db/types.hpp>
