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

#include "utils/exceptions.hpp"

namespace clusterprops::coordination {

/// Any failure reported by the coordination store: protocol errors, lost
/// sessions, interrupted waits. The more specific conditions below derive
/// from it so callers can single them out.
class CoordinationStoreException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(CoordinationStoreException)
};

class NoNodeException final : public CoordinationStoreException {
 public:
  explicit NoNodeException(std::string_view path) noexcept
      : CoordinationStoreException(fmt::format("Node {} does not exist", path)) {}
  SPECIALIZE_GET_EXCEPTION_NAME(NoNodeException)
};

class NodeExistsException final : public CoordinationStoreException {
 public:
  explicit NodeExistsException(std::string_view path) noexcept
      : CoordinationStoreException(fmt::format("Node {} already exists", path)) {}
  SPECIALIZE_GET_EXCEPTION_NAME(NodeExistsException)
};

class BadVersionException final : public CoordinationStoreException {
 public:
  template <typename TVersion>
  BadVersionException(std::string_view path, TVersion expected, TVersion actual) noexcept
      : CoordinationStoreException(
            fmt::format("Version mismatch on node {}: expected {}, current {}", path, expected, actual)) {}
  SPECIALIZE_GET_EXCEPTION_NAME(BadVersionException)
};

class ConnectionLossException final : public CoordinationStoreException {
 public:
  using CoordinationStoreException::CoordinationStoreException;
  SPECIALIZE_GET_EXCEPTION_NAME(ConnectionLossException)
};

}  // namespace clusterprops::coordination
