#include "nomat/core/cvar.hpp"
#include "nomat/core/logger.hpp"
#include <fstream>
#include <stdexcept>
#include <unordered_map>

namespace nomat::core {

static std::unordered_map<std::string, ICVar*>& getCVarMap() {
    static std::unordered_map<std::string, ICVar*> map;
    return map;
}

void CVarSystem::registerCVar(ICVar* cvar) {
  if (cvar == nullptr) {
    return;
  }
    auto& map = getCVarMap();
    if (map.contains(cvar->name)) {
      return;
    }
    map[cvar->name] = cvar;
}

ICVar* CVarSystem::find(const std::string& name) {
    auto& map = getCVarMap();
    auto it = map.find(name);
    if (it != map.end()) {
        return it->second;
    }
    return nullptr;
}

std::unordered_map<std::string, ICVar*>& CVarSystem::getAll() {
    return getCVarMap();
}

bool CVarSystem::setValue(const std::string& name, const std::string& value) {
    ICVar* cvar = find(name);
    if (cvar == nullptr) {
        core::Logger::warn("Unknown CVar: {}", name);
        return false;
    }
    if (cvar->flags & CVarFlags::read_only) {
        core::Logger::warn("CVar {} is read-only", name);
        return false;
    }
    try {
        cvar->setFromString(value);
    } catch (const std::invalid_argument&) {
        core::Logger::warn("Failed to set CVar {} from string value: {}", name, value);
        return false;
    } catch (const std::out_of_range&) {
        core::Logger::warn("Value out of range for CVar {}: {}", name, value);
        return false;
    }
    return true;
}

void CVarSystem::saveToIni(const std::filesystem::path& path) {
    auto& map = getCVarMap();

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    core::Logger::info("Saving CVars to: {}", std::filesystem::absolute(path).string());
    std::ofstream f(path, std::ios::trunc);
    if (!f) {
        core::Logger::error("Failed to open CVar file for writing: {}", path.string());
        return;
    }

    int savedCount = 0;
    for (auto const& [name, cvar] : map) {
        if (cvar->flags & CVarFlags::save) {
            f << name << "=" << cvar->toString() << "\n";
            savedCount++;
        }
    }
    core::Logger::info("Successfully saved {} CVars", savedCount);
}

int CVarSystem::loadFromIni(const std::filesystem::path& path) {
    core::Logger::info("Loading CVars from: {}", std::filesystem::absolute(path).string());
    std::ifstream f(path);
    if (!f) {
        core::Logger::warn("CVar file not found: {}", path.string());
        return 0;
    }

    int loadedCount = 0;
    std::string line;
    while (std::getline(f, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (line.empty() || line[0] == ';') {
        continue;
      }
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
          continue;
        }

        if (setValue(line.substr(0, eq), line.substr(eq + 1))) {
            loadedCount++;
        }
    }
    core::Logger::info("Successfully loaded {} CVars", loadedCount);
    return loadedCount;
}

}
