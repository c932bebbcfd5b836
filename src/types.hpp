#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Rect/Style/Error).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;
  bool contains(int r, int c) const { return r >= row && r < row + height && c >= col && c < col + width; }
};

enum class Color : std::uint8_t { Default, Black, Red, Green, Yellow, Blue, Magenta, Cyan, White };

enum Attr : std::uint8_t {
  AttrNone = 0,
  AttrBold = 1 << 0,
  AttrDim = 1 << 1,
  AttrUnderline = 1 << 2,
  AttrReverse = 1 << 3,
};

struct Style {
  Color fg = Color::Default;
  std::uint8_t attrs = AttrNone;
  bool operator==(const Style&) const = default;
};

enum class BorderType { Plain, Thick };

enum class ErrorKind { None, DocumentLoad, ReferenceResolution, Serialization, Highlight, Render };

struct Error {
  ErrorKind kind = ErrorKind::None;
  std::string message;
  explicit operator bool() const { return kind != ErrorKind::None; }
};

inline bool fail(Error& err, ErrorKind kind, std::string message) {
  err.kind = kind;
  err.message = std::move(message);
  return false;
}

std::string_view error_kind_name(ErrorKind kind);
