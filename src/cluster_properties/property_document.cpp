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

#include "cluster_properties/property_document.hpp"

#include <charconv>

#include "cluster_properties/cluster_properties_exceptions.hpp"
#include "utils/string.hpp"

namespace clusterprops::cluster_properties {

namespace {
// Splits "name[3]" into "name" and 3. Segments without a valid index are returned as is.
std::pair<std::string_view, std::optional<size_t>> ParseSegment(std::string_view segment) {
  if (!segment.ends_with(']')) return {segment, std::nullopt};
  const auto open = segment.rfind('[');
  if (open == std::string_view::npos) return {segment, std::nullopt};

  size_t index = 0;
  const auto digits = segment.substr(open + 1, segment.size() - open - 2);
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
  if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size()) return {segment, std::nullopt};
  return {segment.substr(0, open), index};
}

// Null values only carry meaning when they remove something.
PropertyDocument WithoutNulls(const PropertyDocument &value) {
  if (!value.is_object()) return value;
  auto result = PropertyDocument::object();
  MergeInto(result, value);
  return result;
}

// Key order is kept for presentation only. nlohmann::json sorts object keys, so
// objects nested in arrays compare by content.
bool SameContent(const PropertyDocument &lhs, const PropertyDocument &rhs) {
  return nlohmann::json(lhs) == nlohmann::json(rhs);
}
}  // namespace

PropertyDocument DecodeDocument(std::string_view payload) {
  if (utils::Trim(payload).empty()) return PropertyDocument::object();

  PropertyDocument document;
  try {
    document = PropertyDocument::parse(payload.begin(), payload.end());
  } catch (const PropertyDocument::parse_error &e) {
    throw PropertyDecodeException("Stored cluster properties aren't valid JSON: {}", e.what());
  }
  if (!document.is_object()) {
    throw PropertyDecodeException("Stored cluster properties must be a JSON object, got {}", document.type_name());
  }
  return document;
}

std::string EncodeDocument(const PropertyDocument &document) { return document.dump(2); }

bool MergeInto(PropertyDocument &base, const PropertyDocument &overlay) {
  if (!base.is_object() || !overlay.is_object()) {
    throw InvalidPropertyUpdateException("Only JSON objects can be merged, got {} and {}", base.type_name(),
                                         overlay.type_name());
  }
  bool changed = false;
  for (const auto &[key, value] : overlay.items()) {
    auto it = base.find(key);
    if (value.is_null()) {
      if (it != base.end()) {
        base.erase(key);
        changed = true;
      }
      continue;
    }
    if (it == base.end()) {
      base[key] = WithoutNulls(value);
      changed = true;
      continue;
    }
    if (it->is_object() && value.is_object()) {
      changed = MergeInto(*it, value) || changed;
      continue;
    }
    auto replacement = WithoutNulls(value);
    if (!SameContent(*it, replacement)) {
      *it = std::move(replacement);
      changed = true;
    }
  }
  return changed;
}

MergeResult MergeDocuments(PropertyDocument base, const PropertyDocument &overlay) {
  const auto changed = MergeInto(base, overlay);
  return MergeResult{.merged = std::move(base), .changed = changed};
}

std::optional<PropertyDocument> GetByPath(const PropertyDocument &document, std::string_view path) {
  if (!document.is_object()) return std::nullopt;
  if (auto it = document.find(std::string{path}); it != document.end()) {
    if (it->is_null()) return std::nullopt;
    return *it;
  }

  const PropertyDocument *current = &document;
  for (const auto raw_segment : utils::SplitView(utils::Trim(path, "/"), "/")) {
    if (raw_segment.empty()) continue;
    const auto [segment, index] = ParseSegment(raw_segment);
    if (!segment.empty()) {
      if (!current->is_object()) return std::nullopt;
      auto it = current->find(std::string{segment});
      if (it == current->end()) return std::nullopt;
      current = &*it;
    }
    if (index) {
      if (!current->is_array() || *index >= current->size()) return std::nullopt;
      current = &(*current)[*index];
    }
  }
  if (current->is_null()) return std::nullopt;
  return *current;
}

}  // namespace clusterprops::cluster_properties
