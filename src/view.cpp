#include "view.hpp"

#include "combat_rules.hpp"
#include "version.hpp"

#include <sstream>

CellView viewCell(const Game& game, int x, int y) {
    CellView c;
    const Dungeon& d = game.dungeon();
    if (!d.inBounds(x, y)) return c;

    const Player& p = game.player();
    if (p.pos.x == x && p.pos.y == y) {
        c.glyph = 'S';
        c.light = CellLight::Visible;
        c.role = CellRole::Player;
        return c;
    }

    const Tile& t = d.at(x, y);
    if (!t.visible && !t.explored) return c;

    c.light = t.visible ? CellLight::Visible : CellLight::Remembered;

    if (t.visible) {
        if (const Entity* m = game.monsterAt(x, y)) {
            c.glyph = monsterDef(m->kind).glyph;
            c.role = CellRole::Enemy;
            return c;
        }
        if (game.potionAt(x, y)) {
            c.glyph = '!';
            c.role = CellRole::Potion;
            return c;
        }
    }

    switch (t.type) {
        case TileType::Wall:
            c.glyph = '#';
            c.role = CellRole::Wall;
            break;
        case TileType::Floor:
            c.glyph = '.';
            c.role = CellRole::Floor;
            break;
        case TileType::StairsDown:
            c.glyph = '>';
            c.role = CellRole::Stairs;
            break;
    }
    return c;
}

std::vector<PanelLine> sidePanelLines(const Game& game, int maxLines) {
    std::vector<PanelLine> out;
    const Player& p = game.player();

    auto add = [&](const std::string& s, MessageKind k = MessageKind::Info) {
        out.push_back({s, k});
    };

    add(toUpper(DWARFSLAYER_APPNAME) + " - DEPTH " + std::to_string(game.depth()), MessageKind::System);
    add(game.config().playerName, MessageKind::System);
    {
        std::ostringstream ss;
        ss << "HP " << p.hp << "/" << p.hpMax << "  TURN " << game.turns();
        add(ss.str(), (p.hp * 4 <= p.hpMax) ? MessageKind::Warning : MessageKind::Info);
    }
    {
        std::ostringstream ss;
        ss << "LVL " << p.level << "  XP " << p.xp << "/" << p.xpNext;
        add(ss.str());
    }
    {
        std::ostringstream ss;
        ss << "AT " << p.atk << "  PA " << p.par;
        add(ss.str());
    }
    add("POTIONS: " + std::to_string(p.potions), MessageKind::Loot);
    add("");

    const auto& msgs = game.messages();
    for (auto it = msgs.rbegin(); it != msgs.rend(); ++it) {
        if (static_cast<int>(out.size()) >= maxLines) break;
        std::string line = it->text;
        if (it->repeat > 1) {
            line += " (x" + std::to_string(it->repeat) + ")";
        }
        add(line, it->kind);
    }

    if (maxLines >= 0 && static_cast<int>(out.size()) > maxLines) {
        out.resize(static_cast<size_t>(maxLines));
    }
    return out;
}

std::string helpHint(const KeyBinds& binds) {
    std::ostringstream ss;
    ss << "ARROWS/WASD MOVE  "
       << binds.describeAction(Action::Wait) << " WAIT  "
       << binds.describeAction(Action::Rest) << " REST  "
       << binds.describeAction(Action::Potion) << " POTION  "
       << binds.describeAction(Action::Descend) << " DESCEND  "
       << binds.describeAction(Action::Help) << " HELP  "
       << binds.describeAction(Action::Quit) << " QUIT";
    return ss.str();
}

std::vector<std::string> inventoryLines(const Game& game) {
    const Player& p = game.player();
    std::vector<std::string> out;
    out.push_back("INVENTORY");
    out.push_back("");
    out.push_back("WEAPON: " + p.weapon + " (" + diceToString(playerDamageDice(attr(p.attrs, Attr::KK))) + ")");
    out.push_back("ARMOR:  " + p.armor);
    out.push_back("HEALING DRAUGHTS: " + std::to_string(p.potions));
    out.push_back("");
    for (int i = 0; i < ATTR_COUNT; ++i) {
        const Attr a = static_cast<Attr>(i);
        std::ostringstream ss;
        ss << attrName(a) << " " << attr(p.attrs, a);
        out.push_back(ss.str());
    }
    return out;
}

std::vector<std::string> helpLines(const KeyBinds& binds) {
    std::vector<std::string> out;
    out.push_back("CONTROLS");
    out.push_back("");
    for (const auto& kv : binds.describeAll()) {
        std::string name = kv.first;
        if (name.size() < 10) name.append(10 - name.size(), ' ');
        out.push_back(name + kv.second);
    }
    out.push_back("");
    out.push_back("WALK INTO AN ENEMY TO ATTACK IT.");
    out.push_back("STAND ON > AND PRESS DESCEND TO GO DEEPER.");
    return out;
}

std::vector<std::string> gameOverLines(const Game& game) {
    const Player& p = game.player();
    std::vector<std::string> out;
    out.push_back("YOU HAVE FALLEN");
    out.push_back("");
    if (!game.endCause().empty()) out.push_back(game.endCause());
    out.push_back("DEPTH " + std::to_string(game.depth()) + "  LEVEL " + std::to_string(p.level));
    out.push_back("KILLS " + std::to_string(game.kills()) + "  TURNS " + std::to_string(game.turns()));
    out.push_back("");
    out.push_back("PRESS ANY KEY TO EXIT.");
    return out;
}

Color messageColor(MessageKind kind) {
    switch (kind) {
        case MessageKind::Combat:  return {255, 120, 120, 255};
        case MessageKind::Loot:    return {255, 230, 120, 255};
        case MessageKind::System:  return {160, 200, 255, 255};
        case MessageKind::Warning: return {255, 80, 80, 255};
        case MessageKind::Success: return {120, 255, 120, 255};
        case MessageKind::Info:
        default:                   return {220, 220, 220, 255};
    }
}

Color cellColor(const CellView& c) {
    if (c.light == CellLight::Remembered) {
        return {90, 90, 110, 255};
    }
    switch (c.role) {
        case CellRole::Wall:   return {170, 150, 120, 255};
        case CellRole::Floor:  return {120, 120, 120, 255};
        case CellRole::Stairs: return {255, 255, 255, 255};
        case CellRole::Player: return {255, 255, 255, 255};
        case CellRole::Enemy:  return {255, 90, 90, 255};
        case CellRole::Potion: return {120, 200, 255, 255};
        case CellRole::Nothing:
        default:               return {0, 0, 0, 255};
    }
}
