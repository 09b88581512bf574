#pragma once

#include <wrapcoin/encode/hex.hpp>
