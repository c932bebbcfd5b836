#pragma once
/*
 * App
 *
 * Purpose: owns the panes (fixed set; order = tab order), the focus index and
 * the event → action → update → draw loop.
 * Routing: Update is broadcast to every pane, controller actions (focus, quit,
 * tick, resize) are handled here, the rest goes to the focused pane.
 * Errors: any pane failure stops the loop; run()/dispatch() return false.
 */
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "action.hpp"
#include "highlighted_document.hpp"
#include "input.hpp"
#include "iterminal.hpp"
#include "navigation_state.hpp"
#include "pane.hpp"
#include "pane_layout.hpp"
#include "theme.hpp"

class App {
public:
  enum PaneId { NavigationId = 0, AddressId = 1, RequestId = 2, ResponseId = 3 };
  static constexpr int kAddressRows = 4;
  static constexpr int kMaxFollowUps = 16;

  App(std::shared_ptr<const OpenApiDocument> doc, Theme theme);
  App(const App&) = delete;
  App& operator=(const App&) = delete;

  // init() every pane, focus the first one and broadcast Update.
  bool start(Error& err);
  bool run(IEventSource& events, ITerminal& term, Error& err);
  bool handle_event(const InputEvent& ev, Error& err);
  std::optional<Action> map_event(const InputEvent& ev) const;
  bool dispatch(const Action& action, Error& err);
  bool draw(ITerminal& term, Error& err);

  void set_focus(int idx);
  int focused() const { return focused_; }
  int pane_count() const { return static_cast<int>(panes_.size()); }
  Pane& pane(int idx) { return *panes_[static_cast<size_t>(idx)]; }
  SharedNavigationState& state() { return state_; }
  bool should_quit() const { return quit_; }
  void set_message(std::string msg) { message_ = std::move(msg); }
  std::vector<PaneRect> layout(TermSize size) const;

private:
  void apply_controller(const Action& a);
  bool update_pane(int idx, const Action& action, std::vector<Action>& pending, Error& err);
  void draw_status(ITerminal& term, TermSize size) const;

  SharedNavigationState state_;
  Theme theme_;
  HighlightedDocumentBuilder builder_;
  std::vector<std::unique_ptr<Pane>> panes_;
  std::unique_ptr<SplitNode> layout_;
  int focused_ = 0;
  bool quit_ = false;
  std::string message_;
  TermSize last_size_{0, 0};
};
