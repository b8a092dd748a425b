#pragma once

#include "tinybook/book/node.hpp"
#include "tinybook/book/order.hpp"
#include "tinybook/book/price_encoder.hpp"
#include "tinybook/book/request.hpp"
#include "tinybook/book/reveal.hpp"
#include "tinybook/book/types.hpp"
#include "tinybook/book/wire.hpp"
#include "tinybook/core/config.hpp"
#include "tinybook/core/errors.hpp"
