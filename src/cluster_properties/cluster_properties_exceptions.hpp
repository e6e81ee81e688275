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

#include <string_view>

#include "utils/exceptions.hpp"

namespace clusterprops::cluster_properties {

/// Single-key mutation of a property name outside the configured set.
class UnknownPropertyException final : public utils::BasicException {
 public:
  explicit UnknownPropertyException(std::string_view name) noexcept
      : BasicException(fmt::format("Not a known cluster property {}", name)) {}
  SPECIALIZE_GET_EXCEPTION_NAME(UnknownPropertyException)
};

/// Bulk update which isn't a mapping.
class InvalidPropertyUpdateException final : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(InvalidPropertyUpdateException)
};

/// Stored payload which doesn't decode to a property document.
class PropertyDecodeException final : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(PropertyDecodeException)
};

/// Wraps every coordination store failure which isn't a resolvable conflict.
class ClusterPropertiesIOException final : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(ClusterPropertiesIOException)
};

class RetriesExhaustedException final : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(RetriesExhaustedException)
};

class RetryTimeoutException final : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(RetryTimeoutException)
};

}  // namespace clusterprops::cluster_properties
