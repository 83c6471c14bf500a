#include "jnav/keymap.h"

#include <utility>

namespace jnav {

KeyChord key(KeyCode code, uint8_t modifiers) {
  return KeyChord{code, 0, modifiers};
}

KeyChord ctrl(char letter) {
  return KeyChord{KeyCode::Char, static_cast<uint32_t>(letter), kModCtrl};
}

KeyChord alt(char letter) {
  return KeyChord{KeyCode::Char, static_cast<uint32_t>(letter), kModAlt};
}

Keymap::Keymap(std::vector<Keybinding> editing, std::vector<Keybinding> suggesting)
    : editing_(std::move(editing)), suggesting_(std::move(suggesting)) {}

Keymap Keymap::defaults() {
  std::vector<Keybinding> editing = {
      {Action::Quit, {ctrl('c')}},
      {Action::MoveLeft, {key(KeyCode::Left)}},
      {Action::MoveRight, {key(KeyCode::Right)}},
      {Action::MoveHead, {ctrl('a'), key(KeyCode::Home)}},
      {Action::MoveTail, {ctrl('e'), key(KeyCode::End)}},
      {Action::PrevWord, {alt('b')}},
      {Action::NextWord, {alt('f')}},
      {Action::Backspace, {key(KeyCode::Backspace)}},
      {Action::EraseAll, {ctrl('u')}},
      {Action::ErasePrevWord, {ctrl('w')}},
      {Action::EraseNextWord, {alt('d')}},
      {Action::ViewerUp, {key(KeyCode::Up), ctrl('k')}},
      {Action::ViewerDown, {key(KeyCode::Down), ctrl('j')}},
      {Action::ViewerHead, {ctrl('l')}},
      {Action::ViewerTail, {ctrl('h')}},
      {Action::ToggleFold, {key(KeyCode::Enter)}},
      {Action::CollapseAll, {ctrl('p')}},
      {Action::ExpandAll, {ctrl('n')}},
      {Action::Complete, {key(KeyCode::Tab)}},
  };
  std::vector<Keybinding> suggesting = {
      {Action::Quit, {ctrl('c')}},
      {Action::NextSuggestion, {key(KeyCode::Tab), key(KeyCode::Down)}},
      {Action::PrevSuggestion, {key(KeyCode::BackTab), key(KeyCode::Up)}},
      {Action::AcceptSuggestion, {key(KeyCode::Enter)}},
      {Action::CancelSuggestion, {key(KeyCode::Escape)}},
  };
  return Keymap(std::move(editing), std::move(suggesting));
}

Action Keymap::resolve(const KeyChord& chord, FocusMode mode) const {
  if (mode == FocusMode::Suggesting) return lookup(suggesting_, chord);
  Action action = lookup(editing_, chord);
  if (action != Action::None) return action;
  if (chord.code == KeyCode::Char && chord.modifiers == kModNone && chord.ch >= 0x20 &&
      chord.ch != 0x7f) {
    return Action::InsertChar;
  }
  return Action::None;
}

Action Keymap::lookup(const std::vector<Keybinding>& table, const KeyChord& chord) {
  for (const auto& binding : table) {
    for (const auto& candidate : binding.chords) {
      if (candidate == chord) return binding.action;
    }
  }
  return Action::None;
}

}  // namespace jnav
