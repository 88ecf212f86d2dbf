#include "Leaderboard.hpp"
#include "Utils/Debug/Debug.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

bool Leaderboard::AddScore(int score, int wave, const std::string& name) {
    std::string trimmed = name.substr(0, MAX_NAME_LENGTH);
    // Tabs and newlines would break the file format
    std::replace_if(trimmed.begin(), trimmed.end(), [](char c) { return c == '\t' || c == '\n' || c == '\r'; }, ' ');

    int rank = GetScoreRank(score);
    entries.push_back(LeaderboardEntry{ trimmed, score, wave });
    SortAndTrim();

    if (rank > 0) {
        Debug::Info("Leaderboard") << trimmed << " placed #" << rank << " with " << score << "\n";
    }
    return rank > 0;
}

void Leaderboard::RecordFinalScore(int score, int wave) {
    AddScore(score, wave, playerName);
}

void Leaderboard::SortAndTrim() {
    std::stable_sort(entries.begin(), entries.end(), [](const LeaderboardEntry& a, const LeaderboardEntry& b) {
        return a.score > b.score;
    });
    if (entries.size() > MAX_ENTRIES) {
        entries.resize(MAX_ENTRIES);
    }
}

int Leaderboard::GetHighScore() const {
    return entries.empty() ? 0 : entries.front().score;
}

bool Leaderboard::IsHighScore(int score) const {
    return score > GetHighScore();
}

int Leaderboard::GetRank(int score) const {
    auto it = std::find_if(entries.begin(), entries.end(), [score](const LeaderboardEntry& entry) {
        return score > entry.score;
    });
    return static_cast<int>(it - entries.begin()) + 1;
}

int Leaderboard::GetScoreRank(int score) const {
    int rank = GetRank(score);
    if (entries.size() < MAX_ENTRIES || rank <= static_cast<int>(MAX_ENTRIES)) {
        return rank;
    }
    return 0;
}

bool Leaderboard::Load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Debug::Warning("Leaderboard") << "Cannot open " << path << "\n";
        return false;
    }

    std::vector<LeaderboardEntry> loaded;
    std::string line;
    int skipped = 0;
    while (std::getline(file, line)) {
        if (line.empty()) {
            continue;
        }
        std::istringstream fields(line);
        std::string name, scoreText, waveText;
        if (!std::getline(fields, name, '\t') || !std::getline(fields, scoreText, '\t') ||
            !std::getline(fields, waveText)) {
            skipped++;
            continue;
        }

        try {
            size_t scoreEnd = 0, waveEnd = 0;
            int score = std::stoi(scoreText, &scoreEnd);
            int wave = std::stoi(waveText, &waveEnd);
            if (scoreEnd != scoreText.size() || waveEnd != waveText.size()) {
                skipped++;
                continue;
            }
            loaded.push_back(LeaderboardEntry{ name.substr(0, MAX_NAME_LENGTH), score, wave });
        } catch (const std::logic_error&) {
            skipped++;
        }
    }

    entries = std::move(loaded);
    SortAndTrim();
    Debug::Info("Leaderboard") << "Loaded " << entries.size() << " entries from " << path << "\n";
    if (skipped > 0) {
        Debug::Warning("Leaderboard") << "Skipped " << skipped << " malformed lines in " << path << "\n";
    }
    return true;
}

bool Leaderboard::Save(const std::string& path) const {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        Debug::Error("Leaderboard") << "Cannot write " << path << "\n";
        return false;
    }
    for (const LeaderboardEntry& entry : entries) {
        file << entry.name << '\t' << entry.score << '\t' << entry.wave << '\n';
    }
    if (!file) {
        Debug::Error("Leaderboard") << "Write to " << path << " failed\n";
        return false;
    }
    return true;
}
