#include <doctest/doctest.h>
#include "nomat/core/cvar.hpp"
#include <filesystem>
#include <fstream>

using namespace nomat::core;

namespace {

AUTO_CVAR_INT(test_frameBudget, "Test integer", 16, CVarFlags::save);
AUTO_CVAR_FLOAT(test_blendSpeed, "Test float", 0.5f, CVarFlags::save);
AUTO_CVAR_BOOL(test_locked, "Test read-only", true, CVarFlags::read_only);
AUTO_CVAR_INT(test_transient, "Test unsaved", 3);

std::filesystem::path tempIni(const char* name) {
    return std::filesystem::temp_directory_path() / name;
}

} // namespace

TEST_CASE("CVar Registry") {
    SUBCASE("Kernel variables are registered") {
        CHECK(CVarSystem::find("pga_normTolerance") != nullptr);
        CHECK(CVarSystem::find("anim_defaultLooping") != nullptr);
        CHECK(CVarSystem::find("log_verbose") != nullptr);
        CHECK(CVarSystem::find("no_such_var") == nullptr);
    }

    SUBCASE("Set by name parses the value type") {
        CHECK(CVarSystem::setValue("test_frameBudget", "33"));
        CHECK(test_frameBudget.get() == 33);

        CHECK(CVarSystem::setValue("test_blendSpeed", "0.25"));
        CHECK(test_blendSpeed.get() == doctest::Approx(0.25f));

        CHECK(CVarSystem::setValue("test_transient", "7"));
        CHECK(CVarSystem::find("test_transient")->toString() == "7");

        test_frameBudget.set(16);
        test_blendSpeed.set(0.5f);
    }

    SUBCASE("Rejected assignments leave the value alone") {
        CHECK_FALSE(CVarSystem::setValue("test_frameBudget", "many"));
        CHECK(test_frameBudget.get() == 16);

        CHECK_FALSE(CVarSystem::setValue("test_frameBudget", "99999999999999999999999"));
        CHECK_FALSE(CVarSystem::setValue("test_locked", "false"));
        CHECK(test_locked.get());
        CHECK_FALSE(CVarSystem::setValue("no_such_var", "1"));
    }

    SUBCASE("Bool spelling") {
        auto* cvar = CVarSystem::find("anim_defaultLooping");
        REQUIRE(cvar != nullptr);
        cvar->setFromString("False");
        CHECK(cvar->toString() == "false");
        cvar->setFromString("True");
        CHECK(cvar->toString() == "true");
    }
}

TEST_CASE("CVar Ini Files") {
    SUBCASE("Saved variables load back") {
        const auto path = tempIni("nomat_cvar_roundtrip.ini");
        test_frameBudget.set(24);
        CVarSystem::saveToIni(path);

        test_frameBudget.set(1);
        test_transient.set(9);
        CHECK(CVarSystem::loadFromIni(path) > 0);
        CHECK(test_frameBudget.get() == 24);
        // Unsaved variables are not written.
        CHECK(test_transient.get() == 9);

        test_frameBudget.set(16);
        test_transient.set(3);
        std::filesystem::remove(path);
    }

    SUBCASE("Comments, blank lines and unknown keys are skipped") {
        const auto path = tempIni("nomat_cvar_handwritten.ini");
        {
            std::ofstream f(path, std::ios::trunc);
            f << "; tuning\r\n";
            f << "\n";
            f << "test_blendSpeed=0.75\r\n";
            f << "not a pair\n";
            f << "unknown_var=3\n";
            f << "test_locked=false\n";
        }

        CHECK(CVarSystem::loadFromIni(path) == 1);
        CHECK(test_blendSpeed.get() == doctest::Approx(0.75f));
        CHECK(test_locked.get());

        test_blendSpeed.set(0.5f);
        std::filesystem::remove(path);
    }

    SUBCASE("Missing file loads nothing") {
        CHECK(CVarSystem::loadFromIni(tempIni("nomat_cvar_missing.ini")) == 0);
    }
}
