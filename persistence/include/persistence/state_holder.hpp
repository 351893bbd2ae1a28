#pragma once

#include <persistence/state/state.hpp>

#include <filesystem>
#include <functional>

namespace Persistence
{
    class StateHolder
    {
      public:
        explicit StateHolder(std::filesystem::path path);

        /**
         * @brief Reads the config file. A missing file is created with defaults, an unparsable one is backed up and
         * replaced by defaults.
         *
         * @param onLoad Called with false if loading failed, the state cache then holds defaults.
         */
        void load(std::function<void(bool, StateHolder&)> const& onLoad);

        /**
         * @brief Writes the state cache to disk.
         *
         * @throws std::exception if the file cannot be written.
         */
        void save(std::function<void()> const& onSaveComplete = []() {});

        State& stateCache();
        std::filesystem::path const& path() const;

      private:
        void dataFixer(nlohmann::json const& before);

      private:
        std::filesystem::path path_;
        State stateCache_;
    };
}
