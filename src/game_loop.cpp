#include "game.hpp"

bool Game::handleAction(Action a) {
    if (a == Action::None) return false;

    // Any key ends the run once the player has fallen.
    if (phase_ == GamePhase::GameOver) {
        quitReq = true;
        return false;
    }
    if (phase_ != GamePhase::AwaitingInput) return false;

    switch (a) {
        case Action::Quit:
            quitReq = true;
            return false;
        case Action::Inventory:
            invOpen = !invOpen;
            helpOpen = false;
            return false;
        case Action::Help:
            helpOpen = !helpOpen;
            invOpen = false;
            return false;
        default:
            break;
    }

    invOpen = false;
    helpOpen = false;

    phase_ = GamePhase::ResolvingTurn;

    bool acted = false;
    switch (a) {
        case Action::Up:    acted = tryMovePlayer(0, -1); break;
        case Action::Down:  acted = tryMovePlayer(0, 1); break;
        case Action::Left:  acted = tryMovePlayer(-1, 0); break;
        case Action::Right: acted = tryMovePlayer(1, 0); break;
        case Action::Wait:
            acted = true;
            break;
        case Action::Rest:
            rest();
            acted = true;
            break;
        case Action::Potion:
            acted = quaffPotion();
            break;
        case Action::Descend:
            if (!dung.isStairs(player_.pos.x, player_.pos.y)) {
                pushMsg("THERE ARE NO STAIRS HERE.", MessageKind::Warning);
                break;
            }
            acted = descendStairs();
            break;
        default:
            break;
    }

    if (acted) {
        advanceAfterPlayerAction();
    }

    if (phase_ == GamePhase::ResolvingTurn) {
        phase_ = GamePhase::AwaitingInput;
    }
    return acted;
}

bool Game::tryMovePlayer(int dx, int dy) {
    const int nx = clampi(player_.pos.x + dx, 0, dung.width - 1);
    const int ny = clampi(player_.pos.y + dy, 0, dung.height - 1);

    if (Entity* m = monsterAtMut(nx, ny)) {
        playerAttack(*m);
        return true;
    }

    // Walls block without spending the turn.
    if (!dung.isWalkable(nx, ny)) return false;

    player_.pos = {nx, ny};
    pickupAtPlayer();

    if (dung.isStairs(nx, ny)) {
        if (cfg_.autoDescend) {
            return descendStairs();
        }
        pushMsg("STAIRS LEAD DOWN. PRESS > TO DESCEND.", MessageKind::Info);
    }
    return true;
}

void Game::advanceAfterPlayerAction() {
    ++turnCount;

    // Dead enemies are removed before the enemy phase so they cannot strike back.
    cleanupDead();
    monsterTurn();
    cleanupDead();

    recomputeFov();
}
