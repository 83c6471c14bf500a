#pragma once

#include <cstdint>
#include <vector>

namespace jnav {

/// Every operation the foreground loop can dispatch.
enum class Action {
  None,
  Quit,
  InsertChar,
  Backspace,
  EraseAll,
  ErasePrevWord,
  EraseNextWord,
  MoveLeft,
  MoveRight,
  MoveHead,
  MoveTail,
  PrevWord,
  NextWord,
  ViewerUp,
  ViewerDown,
  ViewerHead,
  ViewerTail,
  ToggleFold,
  ExpandAll,
  CollapseAll,
  Complete,
  NextSuggestion,
  PrevSuggestion,
  AcceptSuggestion,
  CancelSuggestion,
};

/// Which table resolves keys: plain editing or the suggestion list.
enum class FocusMode {
  Editing,
  Suggesting,
};

enum class KeyCode {
  None,
  Char,
  Enter,
  Tab,
  BackTab,
  Backspace,
  Delete,
  Left,
  Right,
  Up,
  Down,
  Home,
  End,
  Escape,
};

constexpr uint8_t kModNone = 0;
constexpr uint8_t kModCtrl = 1;
constexpr uint8_t kModAlt = 2;

/// One decoded key press. `ch` is the codepoint for KeyCode::Char
/// (lowercase letter for Ctrl chords).
struct KeyChord {
  KeyCode code = KeyCode::None;
  uint32_t ch = 0;
  uint8_t modifiers = kModNone;

  bool operator==(const KeyChord& other) const {
    return code == other.code && ch == other.ch && modifiers == other.modifiers;
  }
};

KeyChord key(KeyCode code, uint8_t modifiers = kModNone);
KeyChord ctrl(char letter);
KeyChord alt(char letter);

struct Keybinding {
  Action action = Action::None;
  std::vector<KeyChord> chords;
};

/// Maps key chords to actions with a linear scan per focus mode.
/// Unbound printable characters resolve to InsertChar while editing.
class Keymap {
 public:
  Keymap(std::vector<Keybinding> editing, std::vector<Keybinding> suggesting);

  /// Default bindings: Ctrl-C quit, Emacs-style editing, viewer motions and
  /// Tab-driven completion.
  static Keymap defaults();

  /// Returns Action::None when the chord has no meaning in `mode`.
  Action resolve(const KeyChord& chord, FocusMode mode) const;

 private:
  static Action lookup(const std::vector<Keybinding>& table, const KeyChord& chord);

  std::vector<Keybinding> editing_;
  std::vector<Keybinding> suggesting_;
};

}  // namespace jnav
