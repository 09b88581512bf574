#pragma once

#include <wrapcoin/memory/memory.hpp>
