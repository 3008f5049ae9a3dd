#pragma once

#include <dlfcn.h>
#include <algorithm>
#include <expected>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include <boost/program_options.hpp>

namespace lotledger {

class ILedgerDatabase;

// ═══════════════════════════════════════════════════════════════════════════════
// Plugin Command Line Metadata
// ═══════════════════════════════════════════════════════════════════════════════

struct PluginCommandLineMetadata {
    std::string systemName;       // Имя для --db (sqlite_db)
    std::string displayName;      // SQLiteDatabase
    std::string version;
    std::string description;
    std::vector<std::string> examples;

    // nullptr, если плагин не публикует опций
    const boost::program_options::options_description* commandLineOptions = nullptr;
    std::string path;
};

// ═══════════════════════════════════════════════════════════════════════════════
// TYPE TRAITS: подкаталог и имена функций для каждого типа плагина
// ═══════════════════════════════════════════════════════════════════════════════

template<typename PluginInterface>
struct PluginTypeTraits;

template<>
struct PluginTypeTraits<ILedgerDatabase> {
    static constexpr const char* subdirectory() { return "database"; }
    static constexpr const char* createFunctionName() { return "createDatabase"; }
    static constexpr const char* destroyFunctionName() { return "destroyDatabase"; }
    static constexpr const char* typeName() { return "database"; }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Plugin Manager
// ═══════════════════════════════════════════════════════════════════════════════

template<typename PluginInterface>
class PluginManager {
public:
    using Traits = PluginTypeTraits<PluginInterface>;
    using CreateFunc = PluginInterface* (*)(const char*);
    using DestroyFunc = void (*)(PluginInterface*);
    using StringFunc = const char* (*)();
    using GetOptionsFunc = const boost::program_options::options_description* (*)();

    struct PluginDeleter {
        DestroyFunc destroyFunc;
        void operator()(PluginInterface* ptr) const {
            if (ptr && destroyFunc) {
                destroyFunc(ptr);
            }
        }
    };

    explicit PluginManager(std::string_view pluginPath = "./plugins")
        : pluginPath_(pluginPath) {}

    ~PluginManager() {
        unloadAll();
    }

    PluginManager(const PluginManager&) = delete;
    PluginManager& operator=(const PluginManager&) = delete;

    std::string getPluginPath() const { return pluginPath_; }
    void setPluginPath(std::string_view path) { pluginPath_ = std::string(path); }

    // ═════════════════════════════════════════════════════════════════════════
    // Метаданные
    // ═════════════════════════════════════════════════════════════════════════

    // Библиотека загружается и остается открытой: options_description
    // принадлежит плагину и должен жить, пока его читает парсер
    std::expected<PluginCommandLineMetadata, std::string>
    getPluginCommandLineMetadata(std::string_view name) {
        auto handle = openLibrary(name);
        if (!handle) {
            return std::unexpected(handle.error());
        }
        return readMetadata(*handle, name, libraryPath(name));
    }

    // Все плагины каталога, по имени
    std::vector<PluginCommandLineMetadata> scanAvailablePlugins() {
        std::vector<PluginCommandLineMetadata> available;

        std::filesystem::path pluginDir =
            std::filesystem::path(pluginPath_) / Traits::subdirectory();

        std::error_code ec;
        if (!std::filesystem::is_directory(pluginDir, ec)) {
            return available;
        }

        for (const auto& entry : std::filesystem::directory_iterator(pluginDir, ec)) {
            if (!entry.is_regular_file() || entry.path().extension() != ".so") {
                continue;
            }

            std::string name = entry.path().stem().string();
            auto metadata = getPluginCommandLineMetadata(name);
            if (!metadata) {
                std::cerr << "[PluginManager] Skipping " << entry.path().string()
                          << ": " << metadata.error() << std::endl;
                continue;
            }
            available.push_back(std::move(*metadata));
        }

        std::sort(available.begin(), available.end(),
                  [](const PluginCommandLineMetadata& a, const PluginCommandLineMetadata& b) {
                      return a.systemName < b.systemName;
                  });

        return available;
    }

    // ═════════════════════════════════════════════════════════════════════════
    // Создание экземпляра
    // ═════════════════════════════════════════════════════════════════════════

    std::expected<std::shared_ptr<PluginInterface>, std::string> load(
        std::string_view name,
        std::string_view config = "") {

        auto handle = openLibrary(name);
        if (!handle) {
            return std::unexpected(handle.error());
        }

        auto createFunc = reinterpret_cast<CreateFunc>(
            dlsym(*handle, Traits::createFunctionName()));
        auto destroyFunc = reinterpret_cast<DestroyFunc>(
            dlsym(*handle, Traits::destroyFunctionName()));

        if (!createFunc || !destroyFunc) {
            return std::unexpected(
                "Plugin is missing required symbols: " + std::string(name));
        }

        std::string configStr(config);
        PluginInterface* instance = createFunc(configStr.c_str());
        if (!instance) {
            return std::unexpected(
                std::string("Plugin '") + std::string(name) +
                "' create function returned nullptr");
        }

        std::cout << "[PluginManager] Loaded " << Traits::typeName()
                  << " plugin '" << name << "'" << std::endl;

        return std::shared_ptr<PluginInterface>(instance, PluginDeleter{destroyFunc});
    }

    // Экземпляры, созданные load(), должны быть уничтожены раньше
    void unloadAll() {
        for (auto& [name, handle] : handles_) {
            if (handle) {
                dlclose(handle);
            }
        }
        handles_.clear();
    }

private:
    std::string pluginPath_;
    std::map<std::string, void*> handles_;

    std::filesystem::path libraryPath(std::string_view name) const {
        return std::filesystem::path(pluginPath_) / Traits::subdirectory() /
               (std::string(name) + ".so");
    }

    std::expected<void*, std::string> openLibrary(std::string_view name) {
        auto it = handles_.find(std::string(name));
        if (it != handles_.end()) {
            return it->second;
        }

        std::filesystem::path soPath = libraryPath(name);
        if (!std::filesystem::exists(soPath)) {
            return std::unexpected(
                std::string("Plugin library not found: ") + soPath.string());
        }

        void* handle = dlopen(soPath.c_str(), RTLD_NOW | RTLD_LOCAL);
        if (!handle) {
            const char* error = dlerror();
            return std::unexpected(error ? std::string(error) : "Unknown dlopen error");
        }

        handles_[std::string(name)] = handle;
        return handle;
    }

    static PluginCommandLineMetadata readMetadata(
        void* handle,
        std::string_view name,
        const std::filesystem::path& path) {

        auto symbol = [handle](const char* fn) {
            return reinterpret_cast<StringFunc>(dlsym(handle, fn));
        };

        auto getName = symbol("getPluginName");
        auto getVersion = symbol("getPluginVersion");
        auto getSystemName = symbol("getPluginSystemName");
        auto getDescription = symbol("getPluginDescription");
        auto getExamples = symbol("getPluginExamples");
        auto getOptions = reinterpret_cast<GetOptionsFunc>(
            dlsym(handle, "getCommandLineOptions"));

        PluginCommandLineMetadata metadata;
        metadata.systemName = getSystemName ? getSystemName() : std::string(name);
        metadata.displayName = getName ? getName() : std::string(name);
        metadata.version = getVersion ? getVersion() : "unknown";
        metadata.description = getDescription ? getDescription() : "";
        metadata.commandLineOptions = getOptions ? getOptions() : nullptr;
        metadata.path = path.string();

        // Примеры разделены '\n'
        if (getExamples) {
            std::istringstream iss(getExamples());
            std::string line;
            while (std::getline(iss, line)) {
                if (!line.empty()) {
                    metadata.examples.push_back(line);
                }
            }
        }

        return metadata;
    }
};

using DatabasePluginManager = PluginManager<ILedgerDatabase>;

}  // namespace lotledger
