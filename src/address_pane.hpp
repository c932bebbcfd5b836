#pragma once
/*
 * AddressPane
 *
 * Purpose: header for the selected operation (method, path, operationId,
 * summary, first line of the description, tags). Not scrollable.
 */
#include <string>
#include <vector>
#include "navigation_state.hpp"
#include "pane.hpp"

class AddressPane : public Pane {
public:
  AddressPane(const SharedNavigationState& state, const Theme& theme) : Pane(theme), state_(state) {}

  const char* title() const override { return "Address"; }
  std::optional<Action> handle_key_event(int) override { return std::nullopt; }
  std::optional<Action> handle_mouse_event(const MouseEvent&, int, int) override { return std::nullopt; }
  bool update(const Action& action, std::optional<Action>& follow_up, Error& err) override;
  bool draw(Surface& surface, Error& err) override;

  const std::string& method() const { return method_; }
  const std::string& path() const { return path_; }
  const std::string& description() const { return description_; }

private:
  const SharedNavigationState& state_;
  std::string method_;
  std::string path_;
  std::string detail_;
  std::string description_;
  bool deprecated_ = false;
};
