#ifndef INPUT_HPP
#define INPUT_HPP

#include <unordered_map>

// Per-tick key state machine. A front end (or the headless autopilot) feeds
// key levels with SetKey; the simulation reads them during its tick and the
// caller then calls Update to age the edges.
//
//   Up -> Down (tapped this tick) -> Held -> Released (this tick) -> Up
class Input {
public:
    enum class KeyState { Up, Down, Held, Released };

    void SetKey(int key, bool down) {
        KeyState& state = keys[key];
        if (down && (state == KeyState::Up || state == KeyState::Released)) {
            state = KeyState::Down;
        } else if (!down && (state == KeyState::Down || state == KeyState::Held)) {
            state = KeyState::Released;
        }
    }

    void Update() {
        for (auto& entry : keys) {
            if (entry.second == KeyState::Down) entry.second = KeyState::Held;
            else if (entry.second == KeyState::Released) entry.second = KeyState::Up;
        }
    }

    KeyState GetState(int key) const {
        auto it = keys.find(key);
        return it == keys.end() ? KeyState::Up : it->second;
    }

    // Went down since the last Update
    bool KeyTapped(int key) const { return GetState(key) == KeyState::Down; }
    // Down now, whether or not it was tapped this tick
    bool KeyPressed(int key) const {
        KeyState state = GetState(key);
        return state == KeyState::Down || state == KeyState::Held;
    }

private:
    std::unordered_map<int, KeyState> keys;
};

#endif // INPUT_HPP
