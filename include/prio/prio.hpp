#pragma once

#include "prio/binary_heap.hpp"
#include "prio/error.hpp"
#include "prio/ordering.hpp"
