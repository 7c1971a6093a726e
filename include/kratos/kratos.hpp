// include/kratos/kratos.hpp
// Umbrella header.

#pragma once

#include "client.hpp"
#include "config.hpp"
#include "error.hpp"
#include "message.hpp"
#include "transport.hpp"
