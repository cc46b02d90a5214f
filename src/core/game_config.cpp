#include "gunpong/core/game_config.hpp"

float GameConfig::serveSpeed() const {
    return fieldWidth / GameConstants::ReferenceFieldWidth;
}

GameConfig GameConfig::withField(float width, float height) const {
    GameConfig cfg = *this;
    cfg.fieldWidth = width;
    cfg.fieldHeight = height;
    return cfg;
}
