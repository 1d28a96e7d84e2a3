#include <fstream>
#include <gtest/gtest.h>
#include "../../src/core/config/config.hpp"
#include "../../src/core/errors/errors.hpp"

using namespace Gleaner::Core;

TEST(ConfigTest, ComplexCLI) {
    char* argv[] = {(char*)"gleaner",
                    (char*)"https://shop.test/catalog",
                    (char*)"--template",
                    (char*)"products.json",
                    (char*)"--threads",
                    (char*)"8",
                    (char*)"-j",
                    (char*)"2",
                    (char*)"--no-headless",
                    (char*)"--proxy",
                    (char*)"p1.test:3128",
                    (char*)"--max-retries",
                    (char*)"5",
                    (char*)"--fetcher",
                    (char*)"curl",
                    (char*)"--validate-proxies",
                    (char*)"https://check.test/ip"};
    auto  config = Config::parse(17, argv);

    EXPECT_EQ(config.threads, 8);
    EXPECT_EQ(config.max_jobs, 2);
    EXPECT_EQ(config.max_retries, 5);
    EXPECT_EQ(config.template_path, "products.json");
    EXPECT_EQ(config.fetcher, "curl");
    EXPECT_EQ(config.validate_url, "https://check.test/ip");
    EXPECT_FALSE(config.headless);
    ASSERT_EQ(config.urls.size(), 1u);
    EXPECT_EQ(config.urls[0], "https://shop.test/catalog");
    ASSERT_EQ(config.proxies.size(), 1u);
    EXPECT_EQ(config.proxies[0], "http://p1.test:3128");
}

TEST(ConfigTest, YamlLoading) {
    std::string   yaml_content = R"(
        threads: 6
        max_jobs: 4
        output: "custom_output"
        template: "tpl.json"
        headless: false
        proxy_policy: round_robin
        failure_threshold: 3
        cooldown_ms: 1000
        defense_markers:
          - "access denied"
          - "are you human"
        urls:
          - "https://shop.test/a"
        proxies:
          - "http://yaml_p1:8080"
          - "socks5://yaml_p2:1080"
    )";
    std::ofstream ofs("test_config.yaml");
    ofs << yaml_content;
    ofs.close();

    char* argv[] = {(char*)"gleaner", (char*)"--config", (char*)"test_config.yaml"};
    auto  config = Config::parse(3, argv);

    EXPECT_EQ(config.threads, 6);
    EXPECT_EQ(config.max_jobs, 4);
    EXPECT_EQ(config.output_dir, "custom_output");
    EXPECT_EQ(config.template_path, "tpl.json");
    EXPECT_FALSE(config.headless);
    EXPECT_EQ(config.proxy_policy, "round_robin");
    EXPECT_EQ(config.failure_threshold, 3);
    EXPECT_EQ(config.cooldown_ms, 1000);
    ASSERT_EQ(config.defense_markers.size(), 2u);
    EXPECT_EQ(config.defense_markers[1], "are you human");
    ASSERT_EQ(config.urls.size(), 1u);
    ASSERT_EQ(config.proxies.size(), 2u);
    EXPECT_EQ(config.proxies[1], "socks5://yaml_p2:1080");

    std::remove("test_config.yaml");
}

TEST(ConfigTest, CommandLineOverridesYaml) {
    std::ofstream ofs("test_ovr.yaml");
    ofs << "threads: 6\nmax_retries: 1\n";
    ofs.close();

    char* argv[] = {(char*)"gleaner",
                    (char*)"--config",
                    (char*)"test_ovr.yaml",
                    (char*)"--max-retries",
                    (char*)"7"};
    auto  config = Config::parse(5, argv);

    EXPECT_EQ(config.max_retries, 7);
    EXPECT_EQ(config.threads, 6);

    std::remove("test_ovr.yaml");
}

TEST(ConfigTest, ProxyListFile) {
    std::ofstream pfile("proxies.txt");
    pfile << "http://p1\nhttp://p2\n\np3:8080";
    pfile.close();

    char* argv[] = {(char*)"gleaner", (char*)"--proxy-list", (char*)"proxies.txt"};
    auto  config = Config::parse(3, argv);

    ASSERT_EQ(config.proxies.size(), 3u);
    EXPECT_EQ(config.proxies[0], "http://p1");
    EXPECT_EQ(config.proxies[2], "http://p3:8080");

    std::remove("proxies.txt");
}

TEST(ConfigTest, ProxyListRobustness) {
    std::ofstream ofs("dirty_proxies.txt");
    ofs << "http://p1:8080\n";
    ofs << "  # a comment line  \n";
    ofs << "\n";
    ofs << "  http://p2:9090   # trailing comment\r\n";
    ofs.close();

    auto proxies = Config::load_proxy_list("dirty_proxies.txt");
    ASSERT_EQ(proxies.size(), 2u);
    EXPECT_EQ(proxies[1], "http://p2:9090");
    std::remove("dirty_proxies.txt");
}

TEST(ConfigTest, InvalidYaml) {
    std::ofstream ofs("invalid.yaml");
    ofs << "threads: [not an integer]";
    ofs.close();

    Config config;
    EXPECT_THROW(Config::load_yaml(config, "invalid.yaml"), ConfigError);
    std::remove("invalid.yaml");
}

TEST(ConfigTest, YamlMustBeAMapping) {
    std::ofstream ofs("list.yaml");
    ofs << "- a\n- b\n";
    ofs.close();

    Config config;
    EXPECT_THROW(Config::load_yaml(config, "list.yaml"), ConfigError);
    std::remove("list.yaml");
}

TEST(ConfigTest, NonExistentFiles) {
    Config config;
    EXPECT_THROW(Config::load_yaml(config, "does_not_exist.yaml"), ConfigError);
    EXPECT_THROW(Config::load_proxy_list("does_not_exist.txt"), ConfigError);
}

TEST(ConfigTest, Validation) {
    Config config;
    EXPECT_NO_THROW(config.validate());

    Config bad_threads;
    bad_threads.threads = 0;
    EXPECT_THROW(bad_threads.validate(), ConfigError);

    Config bad_backoff;
    bad_backoff.backoff_base_ms = 500;
    bad_backoff.backoff_cap_ms  = 100;
    EXPECT_THROW(bad_backoff.validate(), ConfigError);

    Config bad_level;
    bad_level.log_level = "verbose";
    EXPECT_THROW(bad_level.validate(), ConfigError);

    Config bad_fetcher;
    bad_fetcher.fetcher = "wget";
    EXPECT_THROW(bad_fetcher.validate(), ConfigError);

    Config bad_check_url;
    bad_check_url.validate_url = "check.test/ip";
    EXPECT_THROW(bad_check_url.validate(), ConfigError);

    Config negative_wait;
    negative_wait.proxy_wait_ms = -1;
    EXPECT_THROW(negative_wait.validate(), ConfigError);
}

TEST(ConfigTest, InvalidCommandLineValueIsRejected) {
    char* argv[] = {(char*)"gleaner", (char*)"--job-concurrency", (char*)"0"};
    EXPECT_THROW(Config::parse(3, argv), ConfigError);
}
