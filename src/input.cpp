#include "input.hpp"
#include <ncurses.h>

static constexpr int ESC = 27;
static constexpr int TAB = '\t';
static constexpr size_t kMaxCount = 9999;

bool Input::consume_gg(int ch) {
  if (ch == 'g') {
    if (pending_g_) { pending_g_ = false; return true; }
    pending_g_ = true; return false;
  }
  pending_g_ = false;
  return false;
}

bool Input::consume_digit(int ch) {
  if (ch >= '1' && ch <= '9') {
    pending_count_ = pending_count_ * 10 + static_cast<size_t>(ch - '0');
  } else if (ch == '0' && pending_count_ > 0) {
    pending_count_ = pending_count_ * 10;
  } else {
    return false;
  }
  if (pending_count_ > kMaxCount) pending_count_ = kMaxCount;
  return true;
}

size_t Input::take_count() {
  size_t c = pending_count_;
  pending_count_ = 0;
  return c;
}

void Input::reset() {
  pending_g_ = false;
  pending_count_ = 0;
}

KeyAction Input::decode_display(int ch) {
  KeyAction k;
  if (ch == ERR) return k;
  if (ch == KEY_RESIZE) { reset(); k.action = Action::Resize; return k; }
  if (consume_digit(ch)) return k;
  if (ch == 'g') {
    if (consume_gg(ch)) { take_count(); k.action = Action::Top; }
    return k;
  }
  pending_g_ = false;
  int count = has_count() ? static_cast<int>(take_count()) : 1;
  k.count = count;
  switch (ch) {
    case KEY_UP: case 'k': k.action = Action::Up; break;
    case KEY_DOWN: case 'j': k.action = Action::Down; break;
    case '\n': case '\r': case KEY_ENTER: k.action = Action::Activate; break;
    case KEY_PPAGE: k.action = Action::PageUp; break;
    case KEY_NPAGE: k.action = Action::PageDown; break;
    case KEY_HOME: k.action = Action::Top; break;
    case KEY_END: case 'G': k.action = Action::Bottom; break;
    case TAB: k.action = Action::ToggleMode; break;
    case 'q': case 'Q': k.action = Action::Quit; break;
    default: k.count = 1; break;
  }
  return k;
}

KeyAction Input::decode_input(int ch) {
  KeyAction k;
  switch (ch) {
    case ERR: break;
    case KEY_RESIZE: k.action = Action::Resize; break;
    case TAB: case ESC: k.action = Action::ToggleMode; break;
    case '\n': case '\r': case KEY_ENTER: k.action = Action::Submit; break;
    case KEY_BACKSPACE: case 127: case 8: k.action = Action::Backspace; break;
    default:
      // printable ASCII and UTF-8 bytes; the app reassembles multi-byte sequences
      if ((ch >= 32 && ch < 127) || (ch >= 128 && ch < 256)) {
        k.action = Action::InsertChar;
        k.ch = ch;
      }
      break;
  }
  return k;
}
