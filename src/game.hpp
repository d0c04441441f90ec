#pragma once
#include "common.hpp"
#include "content.hpp"
#include "dungeon.hpp"
#include "rng.hpp"

#include <cstdint>
#include <string>
#include <vector>

enum class Action : uint8_t {
    None = 0,

    // Movement (bumping an enemy attacks it)
    Up,
    Down,
    Left,
    Right,

    Wait,
    Rest,        // catch your breath: +1 HP, costs a turn
    Potion,      // quaff a healing draught
    Descend,     // take the stairs down (must be standing on them)
    Quit,

    // UI overlays (never consume a turn)
    Inventory,
    Help,
};

// Turn state machine. Input is only accepted in AwaitingInput; ResolvingTurn
// is held while the player's action and the enemy phase are applied.
enum class GamePhase : uint8_t {
    AwaitingInput = 0,
    ResolvingTurn,
    GameOver,
};

enum class MessageKind : uint8_t {
    Info = 0,
    Combat,
    Loot,
    System,
    Warning,
    Success,
};

struct Message {
    std::string text;
    MessageKind kind = MessageKind::Info;

    // Consecutive duplicate messages are compacted by incrementing this counter.
    // Example: "YOU CATCH YOUR BREATH." repeated 3 times becomes one log line with repeat=3.
    int repeat = 1;
};

struct Entity {
    int id = 0;
    EntityKind kind = EntityKind::Goblin;
    Vec2i pos{0,0};

    int hp = 1;
    int hpMax = 1;

    // Not yet hit by the player (first hit gets an opener bonus).
    bool fresh = true;

    // Idle enemies outside the activation range do nothing until woken.
    bool active = false;
};

struct Player {
    Vec2i pos{0,0};
    Attributes attrs{};

    int hp = 20;
    int hpMax = 20;
    int atk = 6;  // AT
    int par = 4;  // PA

    int potions = 0;
    int level = 1;
    int xp = 0;
    int xpNext = 30;

    std::string weapon = "AXE";
    std::string armor = "CLOTH";
};

// A healing draught lying on the floor.
struct GroundItem {
    Vec2i pos{0,0};
};

// Gameplay knobs (filled from settings by the frontends).
struct GameConfig {
    std::string playerName = "SLAYER";
    int fovRadius = 8;
    int activationRange = 12; // 0 = every enemy acts every turn
    bool autoDescend = false;
    int enemiesPerFloor = 12;
    int potionsPerFloor = 7;
};

class Game {
public:
    static constexpr int MAP_W = 60;
    static constexpr int MAP_H = 28;
    static constexpr size_t LOG_MAX = 120;

    Game();

    void setConfig(const GameConfig& cfg) { cfg_ = cfg; }
    const GameConfig& config() const { return cfg_; }

    void newGame(uint32_t seed);

    // Applies one input. Returns true if the action consumed a turn.
    bool handleAction(Action a);

    const Dungeon& dungeon() const { return dung; }
    const std::vector<Entity>& monsters() const { return ents; }
    std::vector<Entity>& monstersMut() { return ents; }
    const std::vector<GroundItem>& groundItems() const { return ground; }
    const Player& player() const { return player_; }
    Player& playerMut() { return player_; }

    // Enemy on a tile (alive only), or nullptr.
    const Entity* monsterAt(int x, int y) const;
    bool potionAt(int x, int y) const;

    int depth() const { return depth_; }
    uint32_t turns() const { return turnCount; }
    uint32_t seed() const { return seed_; }
    uint32_t kills() const { return killCount; }

    GamePhase phase() const { return phase_; }
    bool isGameOver() const { return phase_ == GamePhase::GameOver; }
    bool quitRequested() const { return quitReq; }
    const std::string& endCause() const { return endCause_; }

    bool isInventoryOpen() const { return invOpen; }
    bool isHelpOpen() const { return helpOpen; }

    const std::vector<Message>& messages() const { return msgs; }

    // Progression (also used by tests to drive level-ups directly).
    void grantXp(int amount);

    // Derives the layout seed for a depth from the run seed.
    static uint32_t levelSeed(uint32_t runSeed, int depth);

private:
    void pushMsg(const std::string& s, MessageKind kind = MessageKind::Info);

    void buildLevel();
    void spawnMonstersAndItems();
    void recomputeFov();

    bool tryMovePlayer(int dx, int dy);
    void pickupAtPlayer();
    void playerAttack(Entity& target);
    void onPlayerLevelUp();
    bool quaffPotion();
    void rest();
    bool descendStairs();

    void advanceAfterPlayerAction();
    void monsterTurn();
    void enemyAttack(const Entity& m);
    bool isOccupied(int x, int y) const;
    void cleanupDead();

    Entity* monsterAtMut(int x, int y);

    GameConfig cfg_;

    Dungeon dung;
    RNG rng;
    int depth_ = 1;

    Player player_;
    std::vector<Entity> ents;
    int nextEntityId = 1;
    std::vector<GroundItem> ground;

    std::vector<Message> msgs;

    GamePhase phase_ = GamePhase::AwaitingInput;
    bool quitReq = false;
    bool invOpen = false;
    bool helpOpen = false;

    uint32_t seed_ = 0;
    uint32_t turnCount = 0;
    uint32_t killCount = 0;
    std::string endCause_;
};
