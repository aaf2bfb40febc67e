// modgraph/basic/errors.hpp - Exceptions thrown by external collaborators
//
// Only these failures cross component boundaries as exceptions. Everything
// the compilers find wrong with a file is a Diagnostic instead.
//
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace modgraph
{

/// Content Source could not supply the bytes of a path.
class NotFoundError : public std::runtime_error
{
public:
  explicit NotFoundError(std::string path)
  : std::runtime_error("file not found: " + path), path_(std::move(path))
  {
  }

  [[nodiscard]] const std::string & path() const noexcept { return path_; }

private:
  std::string path_;
};

/// A specifier could not be mapped to a module.
class ResolutionError : public std::runtime_error
{
public:
  ResolutionError(std::string specifier, std::string importer)
  : std::runtime_error(
      "cannot resolve '" + specifier + "'" + (importer.empty() ? "" : " from '" + importer + "'")),
    specifier_(std::move(specifier)),
    importer_(std::move(importer))
  {
  }

  [[nodiscard]] const std::string & specifier() const noexcept { return specifier_; }
  [[nodiscard]] const std::string & importer() const noexcept { return importer_; }

private:
  std::string specifier_;
  std::string importer_;
};

/// A registered source transform rejected its input.
class TransformError : public std::runtime_error
{
public:
  explicit TransformError(const std::string & message, std::optional<uint32_t> offset = std::nullopt)
  : std::runtime_error(message), offset_(offset)
  {
  }

  /// Byte offset of the failure within the transformed source, when known
  [[nodiscard]] std::optional<uint32_t> offset() const noexcept { return offset_; }

private:
  std::optional<uint32_t> offset_;
};

}  // namespace modgraph
