#pragma once

#include <wrapcoin/log/log.hpp>
