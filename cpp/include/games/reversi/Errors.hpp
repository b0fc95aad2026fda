#pragma once

#include "util/Exception.hpp"

namespace reversi {

/*
 * Thrown by GameState::apply_move() when the move is illegal, or when it is submitted on behalf of
 * the player who is not on turn. The state is left unchanged. This is recoverable: the caller
 * should pick another move.
 */
class InvalidMoveError : public util::CleanException {
 public:
  using CleanException::CleanException;
};

/*
 * Thrown when a move is applied to, or searched from, a state in which neither player can move.
 * This indicates a driver bug (the driver must check is_terminal() first), so it is not a
 * CleanException.
 */
class TerminalStateError : public util::Exception {
 public:
  using Exception::Exception;
};

}  // namespace reversi
