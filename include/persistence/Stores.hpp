#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "persistence/Settings.hpp"

namespace blockblast::persistence {

/// Where the single best score lives between runs.
class IHighScoreStore {
public:
    virtual ~IHighScoreStore() = default;

    /// std::nullopt if nothing was stored yet or it could not be read.
    virtual std::optional<std::uint64_t> load() = 0;

    /// Returns false if the value could not be written.
    virtual bool save(std::uint64_t highScore) = 0;
};

class ISettingsStore {
public:
    virtual ~ISettingsStore() = default;

    virtual std::optional<Settings> load() = 0;
    virtual bool save(const Settings& settings) = 0;
};

// ---------- file-backed ----------

class FileHighScoreStore final : public IHighScoreStore {
public:
    explicit FileHighScoreStore(std::string path);

    std::optional<std::uint64_t> load() override;
    bool save(std::uint64_t highScore) override;

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

class FileSettingsStore final : public ISettingsStore {
public:
    explicit FileSettingsStore(std::string path);

    std::optional<Settings> load() override;
    bool save(const Settings& settings) override;

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

// ---------- in-memory (tests, demos) ----------

class MemoryHighScoreStore final : public IHighScoreStore {
public:
    std::optional<std::uint64_t> load() override { return value_; }
    bool save(std::uint64_t highScore) override {
        if (failSaves) return false;
        value_ = highScore;
        ++saveCount;
        return true;
    }

    bool failSaves{false};
    int saveCount{0};

private:
    std::optional<std::uint64_t> value_;
};

class MemorySettingsStore final : public ISettingsStore {
public:
    std::optional<Settings> load() override { return value_; }
    bool save(const Settings& settings) override {
        value_ = settings;
        return true;
    }

private:
    std::optional<Settings> value_;
};

} // namespace blockblast::persistence
