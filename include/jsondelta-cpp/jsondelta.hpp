/// @file jsondelta.hpp
/// @brief Umbrella header for the jsondelta-cpp library.
///
/// Include this single header for the three delta engines (structural,
/// operational, semantic), the text-level API, batch processing, caches,
/// options, logging configuration, and Error/Result.

#pragma once

#include <jsondelta-cpp/api.hpp>
#include <jsondelta-cpp/batch.hpp>
#include <jsondelta-cpp/cache.hpp>
#include <jsondelta-cpp/error.hpp>
#include <jsondelta-cpp/expand.hpp>
#include <jsondelta-cpp/hash.hpp>
#include <jsondelta-cpp/json.hpp>
#include <jsondelta-cpp/logging.hpp>
#include <jsondelta-cpp/operational.hpp>
#include <jsondelta-cpp/options.hpp>
#include <jsondelta-cpp/semantic.hpp>
#include <jsondelta-cpp/structural.hpp>
#include <jsondelta-cpp/text_diff.hpp>
#include <jsondelta-cpp/value.hpp>
