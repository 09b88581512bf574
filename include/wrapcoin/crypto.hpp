#pragma once

#include <wrapcoin/crypto/hash.hpp>
