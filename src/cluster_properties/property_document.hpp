// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace clusterprops::cluster_properties {

/// Property name to value, in insertion order. Values are strings for
/// single-key updates and arbitrary JSON for bulk updates.
using PropertyDocument = nlohmann::ordered_json;

/**
 * Decodes a stored payload. An empty (or whitespace only) payload is an empty
 * document.
 *
 * @throw PropertyDecodeException if the payload isn't JSON or isn't an object.
 */
PropertyDocument DecodeDocument(std::string_view payload);

std::string EncodeDocument(const PropertyDocument &document);

/**
 * Merges `overlay` into `base` in place. For every key of `overlay`:
 *  - null removes the key from `base`,
 *  - two objects are merged recursively,
 *  - anything else replaces the value in `base`.
 * Keys missing from `overlay` are left untouched.
 *
 * @return true if `base` changed.
 * @throw InvalidPropertyUpdateException if either side isn't an object.
 */
bool MergeInto(PropertyDocument &base, const PropertyDocument &overlay);

struct MergeResult {
  PropertyDocument merged;
  bool changed{false};
};

/// Non-destructive MergeInto.
MergeResult MergeDocuments(PropertyDocument base, const PropertyDocument &overlay);

/**
 * Looks up a value by a '/' separated path, e.g. "collectionDefaults/numShards".
 * A segment may end with "[n]" to pick the n-th array element. A key stored
 * verbatim at the top level (slashes included) takes precedence.
 *
 * @return std::nullopt if any segment is missing or the value is null.
 */
std::optional<PropertyDocument> GetByPath(const PropertyDocument &document, std::string_view path);

}  // namespace clusterprops::cluster_properties
