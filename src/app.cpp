#include "app.hpp"
#include <deque>
#include <ncurses.h>
#include <spdlog/spdlog.h>
#include "address_pane.hpp"
#include "navigation_pane.hpp"
#include "request_pane.hpp"
#include "response_pane.hpp"
#include "surface.hpp"
#include "utf8.hpp"

static constexpr int CTRL_c = 'C' - 64;
static constexpr const char* kHelp = "q quit · tab focus · j/k scroll · [ ] switch tab · enter reload";

App::App(std::shared_ptr<const OpenApiDocument> doc, Theme theme)
  : state_(NavigationState{std::move(doc), std::nullopt}),
    theme_(std::move(theme)),
    builder_(theme_) {
  panes_.push_back(std::make_unique<NavigationPane>(state_, theme_));
  panes_.push_back(std::make_unique<AddressPane>(state_, theme_));
  panes_.push_back(std::make_unique<RequestPane>(state_, builder_, theme_));
  panes_.push_back(std::make_unique<ResponsePane>(state_, builder_, theme_));
  using T = SplitNode::Type;
  layout_ = make_split(T::Vertical, make_leaf(NavigationId),
                       make_split(T::Horizontal, make_leaf(AddressId),
                                  make_split(T::Horizontal, make_leaf(RequestId), make_leaf(ResponseId), 0.5f),
                                  0.5f, kAddressRows),
                       1.0f / 3.0f);
}

bool App::start(Error& err) {
  for (auto& p : panes_) {
    if (!p->init(err)) return false;
  }
  focused_ = NavigationId;
  panes_[static_cast<size_t>(focused_)]->focus();
  return dispatch(Action::of(ActionKind::Update), err);
}

std::vector<PaneRect> App::layout(TermSize size) const {
  std::vector<PaneRect> rects;
  Rect area{0, 0, size.rows - 1, size.cols}; // last row: status line
  collect_layout(*layout_, area, rects);
  return rects;
}

void App::set_focus(int idx) {
  if (idx < 0 || idx >= pane_count() || idx == focused_) return;
  panes_[static_cast<size_t>(focused_)]->unfocus();
  focused_ = idx;
  panes_[static_cast<size_t>(focused_)]->focus();
}

std::optional<Action> App::map_event(const InputEvent& ev) const {
  switch (ev.kind) {
    case InputEvent::Kind::Tick: return Action::of(ActionKind::Tick);
    case InputEvent::Kind::Resize: return Action::of(ActionKind::Resize);
    case InputEvent::Kind::Key:
      if (ev.key == 'q' || ev.key == CTRL_c) return Action::of(ActionKind::Quit);
      if (ev.key == '\t') return Action::of(ActionKind::FocusNext);
      if (ev.key == KEY_BTAB) return Action::of(ActionKind::FocusPrev);
      if (ev.key >= '1' && ev.key < '1' + pane_count()) return Action::of(ActionKind::Focus, ev.key - '1');
      return panes_[static_cast<size_t>(focused_)]->handle_key_event(ev.key);
    case InputEvent::Kind::Mouse: {
      auto rects = layout(last_size_);
      int hit = pane_at(rects, ev.mouse.row, ev.mouse.col);
      if (hit < 0) return std::nullopt;
      const PaneRect& pr = rects[static_cast<size_t>(hit)];
      if (pr.pane != focused_) return Action::of(ActionKind::Focus, pr.pane);
      return panes_[static_cast<size_t>(pr.pane)]->handle_mouse_event(ev.mouse, ev.mouse.row - pr.rect.row,
                                                                      ev.mouse.col - pr.rect.col);
    }
  }
  return std::nullopt;
}

void App::apply_controller(const Action& a) {
  switch (a.kind) {
    case ActionKind::Quit: quit_ = true; break;
    case ActionKind::FocusNext: set_focus((focused_ + 1) % pane_count()); break;
    case ActionKind::FocusPrev: set_focus((focused_ + pane_count() - 1) % pane_count()); break;
    case ActionKind::Focus: set_focus(a.arg); break;
    default: break; // tick/resize only trigger the redraw
  }
}

bool App::update_pane(int idx, const Action& action, std::vector<Action>& pending, Error& err) {
  std::optional<Action> follow_up;
  if (!panes_[static_cast<size_t>(idx)]->update(action, follow_up, err)) return false;
  if (follow_up) pending.push_back(*follow_up);
  return true;
}

bool App::dispatch(const Action& action, Error& err) {
  std::deque<Action> queue{action};
  int hops = 0;
  while (!queue.empty()) {
    Action a = queue.front();
    queue.pop_front();
    if (++hops > kMaxFollowUps) {
      spdlog::warn("dropping follow-up chain after {} actions", kMaxFollowUps);
      break;
    }
    std::vector<Action> pending;
    if (is_controller_action(a)) {
      apply_controller(a);
    } else if (is_broadcast(a)) {
      for (int i = 0; i < pane_count(); ++i) {
        if (!update_pane(i, a, pending, err)) return false;
      }
    } else if (!update_pane(focused_, a, pending, err)) {
      return false;
    }
    queue.insert(queue.end(), pending.begin(), pending.end());
  }
  return true;
}

bool App::handle_event(const InputEvent& ev, Error& err) {
  // a message lasts until the user next presses a key or clicks
  if (ev.kind == InputEvent::Kind::Key || ev.kind == InputEvent::Kind::Mouse) message_.clear();
  std::optional<Action> action = map_event(ev);
  if (!action) return true;
  if (action->kind != ActionKind::Tick) spdlog::trace("action {}", action_name(action->kind));
  return dispatch(*action, err);
}

void App::draw_status(ITerminal& term, TermSize size) const {
  Surface line(term, Rect{size.rows - 1, 0, 1, size.cols});
  line.fill(0, 0, size.cols, " ", theme_.status);
  line.draw(0, 1, message_.empty() ? kHelp : message_, theme_.status);
  auto view = state_.read();
  if (!view->document) return;
  const OpenApiDocument& doc = *view->document;
  std::string right = doc.title();
  if (!doc.version().empty()) right += " " + doc.version();
  right += " (openapi " + doc.spec_version() + ") ";
  int col = size.cols - utf8_length(right);
  if (col > utf8_length(message_.empty() ? kHelp : message_) + 3) line.draw(0, col, right, theme_.status);
}

bool App::draw(ITerminal& term, Error& err) {
  TermSize size = term.get_size();
  last_size_ = size;
  term.clear();
  if (size.rows >= 2 && size.cols >= 2) {
    for (const auto& pr : layout(size)) {
      Surface surface(term, pr.rect);
      if (!panes_[static_cast<size_t>(pr.pane)]->draw(surface, err)) return false;
    }
    draw_status(term, size);
  }
  if (!term.refresh()) return fail(err, ErrorKind::Render, "terminal refresh failed");
  return true;
}

bool App::run(IEventSource& events, ITerminal& term, Error& err) {
  if (!draw(term, err)) return false;
  while (!quit_) {
    if (!handle_event(events.next(), err)) return false;
    if (!draw(term, err)) return false;
  }
  return true;
}
