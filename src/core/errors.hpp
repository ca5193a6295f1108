#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace core {

class BridgeError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;

  virtual const char* Kind() const noexcept = 0;
};

// The tool executable could not be started.
class SpawnError : public BridgeError {
 public:
  using BridgeError::BridgeError;
  const char* Kind() const noexcept override { return "spawn_error"; }
};

// Malformed or unexpected line on the wire, or the tool closed its streams.
class ProtocolError : public BridgeError {
 public:
  using BridgeError::BridgeError;
  const char* Kind() const noexcept override { return "protocol_error"; }
};

// The tool answered a call with an error message.
class ToolError : public BridgeError {
 public:
  using BridgeError::BridgeError;
  const char* Kind() const noexcept override { return "tool_error"; }
};

class TimeoutError : public BridgeError {
 public:
  using BridgeError::BridgeError;
  const char* Kind() const noexcept override { return "timeout"; }
};

struct FieldViolation {
  std::string field;
  std::string reason;
};

class ValidationError : public BridgeError {
 public:
  ValidationError(const std::string& message, std::vector<FieldViolation> violations)
      : BridgeError(message), violations_(std::move(violations)) {}

  const char* Kind() const noexcept override { return "validation_error"; }
  const std::vector<FieldViolation>& Violations() const { return violations_; }

 private:
  std::vector<FieldViolation> violations_;
};

// A tool description cannot be turned into a request schema.
class SchemaError : public BridgeError {
 public:
  using BridgeError::BridgeError;
  const char* Kind() const noexcept override { return "schema_error"; }
};

}  // namespace core
