#pragma once
#include <cstddef>
/*
 * Input
 *
 * Purpose: turn key codes into demo actions for display and input mode.
 * Extend: count prefixes ("5j") and the double-key gg keep minimal pending state.
 */

enum class Action {
  None, Up, Down, Activate, PageUp, PageDown, Top, Bottom, ToggleMode, Quit,
  InsertChar, Backspace, Submit, Resize
};

struct KeyAction {
  Action action = Action::None;
  int count = 1;
  int ch = 0; // InsertChar only
};

class Input {
public:
  KeyAction decode_display(int ch);
  KeyAction decode_input(int ch);
  bool consume_gg(int ch);
  bool consume_digit(int ch);
  bool has_count() const { return pending_count_ > 0; }
  size_t take_count();
  void reset();
private:
  bool pending_g_ = false;
  size_t pending_count_ = 0;
};
