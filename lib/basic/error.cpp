// nestgeom/basic/error.cpp - Error codes and messages
#include "nestgeom/basic/error.hpp"

#include <fmt/core.h>

#include <utility>

namespace nestgeom
{

std::string_view error_code_string(ErrorCode code) noexcept
{
  switch (code) {
    case ErrorCode::AlreadyNested:
      return "E001";
    case ErrorCode::NameNotFound:
      return "E002";
    case ErrorCode::InvalidLatticeAttachment:
      return "E003";
    case ErrorCode::EmptyCombinator:
      return "E004";
    case ErrorCode::EmptyLatticeSelection:
      return "E005";
  }
  return "E000";
}

std::string_view to_string(NameSpace ns) noexcept
{
  switch (ns) {
    case NameSpace::Surface:
      return "surface";
    case NameSpace::Cell:
      return "cell";
    case NameSpace::Universe:
      return "universe";
  }
  return "unknown";
}

std::string_view table_key(NameSpace ns) noexcept
{
  switch (ns) {
    case NameSpace::Surface:
      return "surfaces";
    case NameSpace::Cell:
      return "cells";
    case NameSpace::Universe:
      return "universes";
  }
  return "unknown";
}

NameNotFoundError::NameNotFoundError(NameSpace ns, std::string name)
: NestError(
    ErrorCode::NameNotFound,
    fmt::format("{} '{}' is not defined in the system", to_string(ns), name)),
  ns_(ns),
  name_(std::move(name))
{
}

}  // namespace nestgeom
