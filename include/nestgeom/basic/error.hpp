// nestgeom/basic/error.hpp - Exceptions raised while building or rendering units
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace nestgeom
{

enum class ErrorCode : uint8_t {
  AlreadyNested,             ///< E001
  NameNotFound,              ///< E002
  InvalidLatticeAttachment,  ///< E003
  EmptyCombinator,           ///< E004
  EmptyLatticeSelection,     ///< E005
};

/// Short diagnostic code for an error ("E001", ...).
[[nodiscard]] std::string_view error_code_string(ErrorCode code) noexcept;

/**
 * Base class of every error raised by the unit builder, the renderers and
 * the registry. Nothing in the library recovers from these; they are meant
 * to reach the caller unchanged.
 */
class NestError : public std::runtime_error
{
public:
  NestError(ErrorCode code, const std::string & message)
  : std::runtime_error(message), code_(code)
  {
  }

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

/// A unit was given a second outer level, a second inner level, or a cycle.
class AlreadyNestedError : public NestError
{
public:
  explicit AlreadyNestedError(const std::string & message)
  : NestError(ErrorCode::AlreadyNested, message)
  {
  }
};

/// Which table of the system definition a name was looked up in.
enum class NameSpace : uint8_t {
  Surface,
  Cell,
  Universe,
};

[[nodiscard]] std::string_view to_string(NameSpace ns) noexcept;

/// Key of the system table holding names of this kind ("surfaces", ...).
[[nodiscard]] std::string_view table_key(NameSpace ns) noexcept;

/// The registry has no entry for a referenced surface, cell or universe.
class NameNotFoundError : public NestError
{
public:
  NameNotFoundError(NameSpace ns, std::string name);

  [[nodiscard]] NameSpace name_space() const noexcept { return ns_; }
  [[nodiscard]] const std::string & name() const noexcept { return name_; }

private:
  NameSpace ns_;
  std::string name_;
};

/// A lattice spec was attached to something other than a nested cell.
class InvalidLatticeAttachmentError : public NestError
{
public:
  explicit InvalidLatticeAttachmentError(const std::string & message)
  : NestError(ErrorCode::InvalidLatticeAttachment, message)
  {
  }
};

/// A union, vector or nesting chain was built from zero members.
class EmptyCombinatorError : public NestError
{
public:
  explicit EmptyCombinatorError(const std::string & message)
  : NestError(ErrorCode::EmptyCombinator, message)
  {
  }
};

/// A coordinate list lattice spec was built from zero points.
class EmptyLatticeSelectionError : public NestError
{
public:
  explicit EmptyLatticeSelectionError(const std::string & message)
  : NestError(ErrorCode::EmptyLatticeSelection, message)
  {
  }
};

}  // namespace nestgeom
