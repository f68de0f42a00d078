#include <gtest/gtest.h>
#include "../src/localization.hpp"

#include <filesystem>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <regex>
#include <set>
#include <vector>

namespace fs = std::filesystem;

class L10nIntegrityTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
    }

    std::set<std::string> extract_keys_from_source(const fs::path& src_dir) {
        std::set<std::string> keys;
        // Literal keys passed to the lookup helpers; dotted names only.
        std::regex key_regex(R"((?:get_string|string_format)\s*\(\s*"([a-z_]+\.[a-z_.]+)\")");

        for (const auto& dir_entry : fs::recursive_directory_iterator(src_dir)) {
            const auto ext = dir_entry.path().extension();
            if (!dir_entry.is_regular_file() || (ext != ".cpp" && ext != ".hpp")) continue;
            std::ifstream f(dir_entry.path());
            std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
            for (auto it = std::sregex_iterator(content.begin(), content.end(), key_regex); it != std::sregex_iterator(); ++it) {
                keys.insert((*it)[1].str());
            }
        }
        return keys;
    }

    std::set<std::string> keys_in_catalog(const fs::path& file) {
        std::set<std::string> keys;
        std::ifstream in(file);
        std::string line;
        while (std::getline(in, line)) {
            if (line.empty() || line[0] == '#') continue;
            const auto eq = line.find('=');
            if (eq != std::string::npos) keys.insert(line.substr(0, eq));
        }
        return keys;
    }

    const fs::path source_root = BOREALIS_SOURCE_DIR;
};

TEST_F(L10nIntegrityTest, AllSourceKeysExistInTranslations) {
    const auto source_keys = extract_keys_from_source(source_root / "src");
    ASSERT_FALSE(source_keys.empty());

    std::vector<std::string> missing_keys;
    for (const auto& key : source_keys) {
        if (get_string(key).find("[MISSING_STRING:") != std::string::npos) {
            missing_keys.push_back(key);
        }
    }

    std::string error_msg = "The following keys are missing in localization files: ";
    for (const auto& k : missing_keys) error_msg += k + ", ";
    EXPECT_TRUE(missing_keys.empty()) << error_msg;
}

TEST_F(L10nIntegrityTest, CatalogsDefineTheSameKeys) {
    const auto en = keys_in_catalog(source_root / "l10n" / "en.txt");
    const auto zh = keys_in_catalog(source_root / "l10n" / "zh.txt");
    ASSERT_FALSE(en.empty());

    std::vector<std::string> only_en;
    std::vector<std::string> only_zh;
    std::ranges::set_difference(en, zh, std::back_inserter(only_en));
    std::ranges::set_difference(zh, en, std::back_inserter(only_zh));
    EXPECT_TRUE(only_en.empty()) << "untranslated: " << only_en.size();
    EXPECT_TRUE(only_zh.empty()) << "unknown in en.txt: " << only_zh.size();
}
