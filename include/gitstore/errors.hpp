#pragma once
#include "gitstore/hash.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace gitstore {

// Base of every error raised by the store and ref layers.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Malformed serialized bytes. `field()` names the part that failed to parse.
class DecodeError : public Error {
public:
  DecodeError(std::string_view field, std::string_view detail);
  [[nodiscard]] const std::string &field() const { return field_; }

private:
  std::string field_;
};

class ObjectNotFound : public Error {
public:
  explicit ObjectNotFound(const ObjectId &id);
  [[nodiscard]] const ObjectId &id() const { return id_; }

private:
  ObjectId id_;
};

class RefError : public Error {
public:
  RefError(std::string_view what, std::string name);
  [[nodiscard]] const std::string &name() const { return name_; }

private:
  std::string name_;
};

class RefNotFound : public RefError {
public:
  explicit RefNotFound(std::string name);
};

// A symbolic chain ends at a name that has no stored value.
class DanglingRef : public RefError {
public:
  DanglingRef(std::string name, std::string target);
  [[nodiscard]] const std::string &target() const { return target_; }

private:
  std::string target_;
};

class RefCycle : public RefError {
public:
  explicit RefCycle(std::string name);
};

// Optimistic-concurrency conflict: re-read and retry.
class RefRaceError : public RefError {
public:
  RefRaceError(std::string name, std::string_view detail);
};

class InvalidRefName : public RefError {
public:
  explicit InvalidRefName(std::string name);
};

class IoError : public Error {
public:
  IoError(const std::filesystem::path &path, std::string_view detail);
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace gitstore
