#ifndef TUI_HPP
#define TUI_HPP

namespace tui {
// Runs the inventory browser until the user quits.
// Throws when the terminal cannot be driven.
void init();
}  // namespace tui

#endif  // TUI_HPP
