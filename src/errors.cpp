#include "gitstore/errors.hpp"

#include <utility>

namespace gitstore {

DecodeError::DecodeError(std::string_view field, std::string_view detail)
    : Error("decode error in " + std::string(field) + ": " + std::string(detail)),
      field_(field) {}

ObjectNotFound::ObjectNotFound(const ObjectId &id)
    : Error("object not found: " + id.hex()), id_(id) {}

RefError::RefError(std::string_view what, std::string name)
    : Error(std::string(what) + ": " + name), name_(std::move(name)) {}

RefNotFound::RefNotFound(std::string name) : RefError("ref not found", std::move(name)) {}

DanglingRef::DanglingRef(std::string name, std::string target)
    : RefError("dangling ref (-> " + target + ")", std::move(name)), target_(std::move(target)) {}

RefCycle::RefCycle(std::string name) : RefError("symbolic ref cycle", std::move(name)) {}

RefRaceError::RefRaceError(std::string name, std::string_view detail)
    : RefError("ref update race (" + std::string(detail) + ")", std::move(name)) {}

InvalidRefName::InvalidRefName(std::string name) : RefError("invalid ref name", std::move(name)) {}

IoError::IoError(const std::filesystem::path &path, std::string_view detail)
    : Error(std::string(detail) + ": " + path.string()), path_(path) {}

} // namespace gitstore
