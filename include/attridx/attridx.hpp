/**
 * @file attridx.hpp
 * @brief Main header for attridx - immutable attribute indexes over unsortable values
 *
 * Typical use:
 *
 *   struct person { std::string city; };
 *   std::vector<person> people = ...;
 *
 *   auto index = attridx::make_attribute_index(people, &person::city,
 *                                              {.cardinality_threshold = 100});
 *   if (index) {
 *       auto ids = index->get("Oslo");   // positions in `people`, ascending
 *   }
 */

#pragma once

#include "core.hpp"
#include "hashers.hpp"
#include "primitives.hpp"
#include "bucketed_index.hpp"
#include "attribute_index.hpp"
