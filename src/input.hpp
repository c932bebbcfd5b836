#pragma once
/*
 * Input
 *
 * Purpose: turn raw ncurses getch/getmouse results into InputEvent values.
 * Ticks: getch times out after tick_ms and yields a Tick so the loop redraws.
 */
#include <cstddef>

enum class MouseButton { Left, WheelUp, WheelDown, Other };

struct MouseEvent {
  int row = 0;
  int col = 0;
  MouseButton button = MouseButton::Other;
};

struct InputEvent {
  enum class Kind { Key, Mouse, Resize, Tick };
  Kind kind = Kind::Tick;
  int key = 0;
  MouseEvent mouse{};

  static InputEvent key_press(int ch) { InputEvent e; e.kind = Kind::Key; e.key = ch; return e; }
  static InputEvent mouse_event(MouseEvent m) { InputEvent e; e.kind = Kind::Mouse; e.mouse = m; return e; }
  static InputEvent resize() { InputEvent e; e.kind = Kind::Resize; return e; }
  static InputEvent tick() { return InputEvent{}; }
};

class IEventSource {
public:
  virtual ~IEventSource() = default;
  virtual InputEvent next() = 0;
};

class Input : public IEventSource {
public:
  explicit Input(int tick_ms) : tick_ms_(tick_ms) {}
  InputEvent next() override;
  static InputEvent translate(int ch);
private:
  int tick_ms_;
};
