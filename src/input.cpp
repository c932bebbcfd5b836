#include "input.hpp"
#include <ncurses.h>

static MouseButton button_from_state(mmask_t bstate) {
  if (bstate & (BUTTON1_PRESSED | BUTTON1_CLICKED | BUTTON1_RELEASED)) return MouseButton::Left;
  #ifdef BUTTON4_PRESSED
  if (bstate & BUTTON4_PRESSED) return MouseButton::WheelUp;
  #endif
  #ifdef BUTTON5_PRESSED
  if (bstate & BUTTON5_PRESSED) return MouseButton::WheelDown;
  #endif
  return MouseButton::Other;
}

InputEvent Input::translate(int ch) {
  if (ch == ERR) return InputEvent::tick();
  if (ch == KEY_RESIZE) return InputEvent::resize();
  if (ch == KEY_MOUSE) {
    MEVENT me;
    if (getmouse(&me) != OK) return InputEvent::tick();
    return InputEvent::mouse_event(MouseEvent{me.y, me.x, button_from_state(me.bstate)});
  }
  return InputEvent::key_press(ch);
}

InputEvent Input::next() {
  timeout(tick_ms_);
  return translate(getch());
}
