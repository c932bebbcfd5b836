#pragma once
/*
 * NavigationPane
 *
 * Purpose: list of operations; the only writer of NavigationState.
 * A selection change replaces the state and emits Update so every pane rebuilds.
 */
#include "navigation_state.hpp"
#include "pane.hpp"

class NavigationPane : public Pane {
public:
  NavigationPane(SharedNavigationState& state, const Theme& theme) : Pane(theme), state_(state) {}

  const char* title() const override { return "Operations"; }
  bool init(Error& err) override;
  std::optional<Action> handle_key_event(int key) override;
  std::optional<Action> handle_mouse_event(const MouseEvent& ev, int row, int col) override;
  bool update(const Action& action, std::optional<Action>& follow_up, Error& err) override;
  bool draw(Surface& surface, Error& err) override;

private:
  bool select(int idx, std::optional<Action>& follow_up);
  int top_for(int selected, int rows) const;

  SharedNavigationState& state_;
  int list_rows_ = 0;
};
