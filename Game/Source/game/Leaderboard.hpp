#pragma once

#include "GameManager.hpp"
#include <string>
#include <utility>
#include <vector>

struct LeaderboardEntry {
    std::string name;
    int score;
    int wave;
};

// Top scores, highest first. Persists as one tab-separated line per entry.
class Leaderboard : public IScoreRecorder {
public:
    static constexpr size_t MAX_ENTRIES = 10;
    static constexpr size_t MAX_NAME_LENGTH = 20;

    explicit Leaderboard(std::string playerName = "Anonymous") : playerName(std::move(playerName)) {}

    // True when the entry made it into the table
    bool AddScore(int score, int wave, const std::string& name);

    void RecordFinalScore(int score, int wave) override;

    int GetHighScore() const;
    bool IsHighScore(int score) const;

    // 1-based position the score would take
    int GetRank(int score) const;
    // Like GetRank, but 0 when the score would not make the table
    int GetScoreRank(int score) const;

    const std::vector<LeaderboardEntry>& GetEntries() const { return entries; }
    void Clear() { entries.clear(); }

    // Malformed lines are skipped. False when the file cannot be read or written.
    bool Load(const std::string& path);
    bool Save(const std::string& path) const;

private:
    void SortAndTrim();

    std::string playerName;
    std::vector<LeaderboardEntry> entries;
};
