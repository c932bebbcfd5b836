#pragma once
/*
 * SchemaPane
 *
 * Purpose: common base of the request/response panes: a row of tabs (media
 * types or status codes) above a scrollable highlighted schema.
 * Rebuild: state is read once per action; results are committed only after
 * every stage succeeded, so a failed rebuild leaves the old cache in place.
 */
#include <string>
#include <vector>
#include "highlighted_document.hpp"
#include "navigation_state.hpp"
#include "operation_content.hpp"
#include "pane.hpp"
#include "schema_view.hpp"

class SchemaPane : public Pane {
public:
  std::optional<Action> handle_key_event(int key) override;
  std::optional<Action> handle_mouse_event(const MouseEvent& ev, int row, int col) override;
  bool update(const Action& action, std::optional<Action>& follow_up, Error& err) override;
  bool draw(Surface& surface, Error& err) override;

  const SchemaView& view() const { return view_; }
  const std::vector<std::string>& tabs() const { return tabs_; }
  int tab() const { return tab_; }

protected:
  SchemaPane(const SharedNavigationState& state, const HighlightedDocumentBuilder& builder, const Theme& theme)
    : Pane(theme), state_(state), builder_(builder) {}

  // Re-reads the operation (possibly none selected); fills tabs, the default
  // tab and the lines of that tab.
  virtual bool load(const NavigationState& s, std::vector<std::string>& tabs, int& tab,
                    std::vector<HighlightedLine>& lines, Error& err) = 0;
  virtual bool load_tab(const NavigationState& s, int tab, std::vector<HighlightedLine>& lines, Error& err) = 0;
  // Optional line(s) between tabs and schema; returns rows used.
  virtual int draw_caption(Surface&) const { return 0; }

  bool build_schema(const NavigationState& s, const std::vector<MediaContent>& contents, int idx,
                    std::vector<HighlightedLine>& lines, Error& err) const;

  const SharedNavigationState& state_;
  const HighlightedDocumentBuilder& builder_;

private:
  bool reload(Error& err);
  bool switch_tab(int delta, Error& err);
  void draw_tabs(Surface& row) const;

  SchemaView view_;
  std::vector<std::string> tabs_;
  int tab_ = -1;
};
