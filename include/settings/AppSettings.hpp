#pragma once

#include "settings/EnvUtils.hpp"
#include <string>

namespace chronicle::settings
{

    /**
     * @brief Общие настройки сервиса
     *
     * CHRONICLE_STORAGE: "postgres" (по умолчанию) или "memory" для локального запуска без БД.
     * Аргумент командной строки --in-memory имеет приоритет над переменной.
     */
    class AppSettings
    {
    public:
        static constexpr const char *STORAGE_POSTGRES = "postgres";
        static constexpr const char *STORAGE_MEMORY = "memory";

        AppSettings()
        {
            storage_ = getEnvOrDefault("CHRONICLE_STORAGE", STORAGE_POSTGRES);
        }

        std::string getStorage() const { return storage_; }
        void setStorage(const std::string &storage) { storage_ = storage; }
        bool useInMemoryStorage() const { return storage_ == STORAGE_MEMORY; }

    private:
        std::string storage_;
    };

} // namespace chronicle::settings
