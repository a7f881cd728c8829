#include "async_tls/core/config_loader.hpp"
#include "async_tls/core/path_util.hpp"
#include "async_tls/tls/tls_config.hpp"
#include "async_tls/tls/tls_context.hpp"
#include "async_tls/tls/tls_error.hpp"
#include "support/log_capture.hpp"
#include "support/test_certs.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace{
using config_loader::config_error;

class config_fixture : public ::testing::Test{
protected:
    std::filesystem::path dir;

    void SetUp() override{
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = std::filesystem::temp_directory_path()
            / ("async_tls_" + std::to_string(::getpid()) + "_" + info->name());
        std::filesystem::create_directories(dir);
    }

    void TearDown() override{
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::filesystem::path write_file(const std::string& name, const std::string& body){
        std::filesystem::path p = dir / name;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out << body;
        return p;
    }
};

error_code config_err(config_error e){
    return error_code::from_config(e);
}
}

TEST(config_loader_text, trim_and_quotes){
    EXPECT_EQ(config_loader::trim("  a b \t"), "a b");
    EXPECT_EQ(config_loader::trim_wrapping_quotes("\"x y\""), "x y");
    EXPECT_EQ(config_loader::trim_wrapping_quotes("'z'"), "z");
    EXPECT_EQ(config_loader::trim_wrapping_quotes("\"mixed'"), "\"mixed'");
    EXPECT_TRUE(config_loader::is_comment_or_blank("   # note"));
    EXPECT_TRUE(config_loader::is_comment_or_blank("   "));
    EXPECT_FALSE(config_loader::is_comment_or_blank(" key = v"));
}

TEST_F(config_fixture, loads_key_values_skipping_comments){
    auto path = write_file("a.conf",
        "# comment\n"
        "\n"
        "tls.role = server\n"
        "tls.cert = \"certs/leaf.pem\"\n"
        "  tls.key='certs/leaf.key'  \n"
    );
    auto cfg = config_loader::load_key_value_file(path.string());
    ASSERT_TRUE(cfg.has_value()) << to_string(cfg.error());
    EXPECT_EQ(cfg->size(), 3u);
    EXPECT_EQ(cfg->at("tls.role"), "server");
    EXPECT_EQ(cfg->at("tls.cert"), "certs/leaf.pem");
    EXPECT_EQ(cfg->at("tls.key"), "certs/leaf.key");
}

TEST_F(config_fixture, rejects_bad_files){
    auto missing = config_loader::load_key_value_file((dir / "nope.conf").string());
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), config_err(config_error::file_not_found));

    auto malformed = config_loader::load_key_value_file(write_file("m.conf", "just words\n").string());
    ASSERT_FALSE(malformed.has_value());
    EXPECT_EQ(malformed.error(), config_err(config_error::malformed_line));

    auto empty_key = config_loader::load_key_value_file(write_file("e.conf", " = v\n").string());
    ASSERT_FALSE(empty_key.has_value());
    EXPECT_EQ(empty_key.error(), config_err(config_error::empty_key));

    auto dup = config_loader::load_key_value_file(write_file("d.conf", "a=1\na=2\n").string());
    ASSERT_FALSE(dup.has_value());
    EXPECT_EQ(dup.error(), config_err(config_error::duplicate_key));
}

TEST_F(config_fixture, rejected_line_number_is_logged){
    log_capture logs(logger::log_level::warn);
    auto path = write_file("n.conf", "# header\na = 1\n\nbroken\n");
    auto cfg = config_loader::load_key_value_file(path.string());
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(logs.count(logger::log_level::warn), 1u);
    EXPECT_TRUE(logs.contains("line 4 rejected"));
}

TEST(config_loader_values, require_all_reports_first_missing){
    config_loader::config_map cfg{{"a", "1"}, {"b", "2"}};
    EXPECT_TRUE(config_loader::require_all(cfg, {"a", "b"}).has_value());
    auto missing = config_loader::require_all(cfg, {"a", "c"});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), config_err(config_error::missing_required_key));
}

TEST(config_loader_values, typed_getters){
    config_loader::config_map cfg{
        {"on", "yes"}, {"off", "0"}, {"bad", "maybe"},
        {"n", "16384"}, {"neg", "-1"}, {"trail", "12x"}, {"blank", ""}
    };
    EXPECT_TRUE(*config_loader::get_bool_or(cfg, "on", false));
    EXPECT_FALSE(*config_loader::get_bool_or(cfg, "off", true));
    EXPECT_TRUE(*config_loader::get_bool_or(cfg, "absent", true));
    EXPECT_EQ(config_loader::get_bool_or(cfg, "bad", false).error(), config_err(config_error::invalid_value));

    EXPECT_EQ(*config_loader::get_size_or(cfg, "n", 0), 16384u);
    EXPECT_EQ(*config_loader::get_size_or(cfg, "absent", 7), 7u);
    EXPECT_FALSE(config_loader::get_size_or(cfg, "neg", 0).has_value());
    EXPECT_FALSE(config_loader::get_size_or(cfg, "trail", 0).has_value());
    EXPECT_FALSE(config_loader::get_size_or(cfg, "blank", 0).has_value());

    EXPECT_EQ(config_loader::get_or(cfg, "absent", "dflt"), "dflt");
    EXPECT_EQ(config_loader::require(cfg, "absent").error(), config_err(config_error::missing_required_key));
}

TEST(tls_config_map, client_defaults){
    config_loader::config_map cfg{{"tls.server_name", "example.test"}};
    auto c = tls_config::from_map(cfg, "/etc/app");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->role, tls_role::client);
    EXPECT_EQ(c->server_name, "example.test");
    EXPECT_TRUE(c->ca_file_path.empty());
    EXPECT_EQ(c->options.min_version, tls_version::tls1_2);
    EXPECT_FALSE(c->options.early_data);
}

TEST(tls_config_map, client_needs_server_name){
    auto missing = tls_config::from_map({}, "/");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), config_err(config_error::missing_required_key));

    auto empty = tls_config::from_map({{"tls.server_name", ""}}, "/");
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error(), config_err(config_error::invalid_value));
}

TEST(tls_config_map, server_requires_identity_and_defaults_early_budget){
    auto no_key = tls_config::from_map({{"tls.role", "server"}, {"tls.cert", "c.pem"}}, "/srv");
    ASSERT_FALSE(no_key.has_value());
    EXPECT_EQ(no_key.error(), config_err(config_error::missing_required_key));

    auto s = tls_config::from_map({
        {"tls.role", "server"}, {"tls.cert", "c.pem"}, {"tls.key", "/abs/k.pem"},
        {"tls.min_version", "1.3"}, {"tls.early_data", "true"}
    }, "/srv");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->role, tls_role::server);
    EXPECT_EQ(s->private_key_path, "/abs/k.pem");
    EXPECT_EQ(std::filesystem::path(s->cert_chain_path).filename().string(), "c.pem");
    EXPECT_EQ(s->options.min_version, tls_version::tls1_3);
    EXPECT_TRUE(s->options.early_data);
    EXPECT_EQ(s->options.max_early_data, 16384u);
}

TEST(tls_config_map, rejects_bad_enums){
    auto role = tls_config::from_map({{"tls.role", "proxy"}}, "/");
    ASSERT_FALSE(role.has_value());
    EXPECT_EQ(role.error(), config_err(config_error::invalid_value));

    auto ver = tls_config::from_map({{"tls.server_name", "h"}, {"tls.min_version", "1.1"}}, "/");
    ASSERT_FALSE(ver.has_value());
    EXPECT_EQ(ver.error(), config_err(config_error::invalid_value));
}

TEST_F(config_fixture, relative_paths_resolve_against_config_dir){
    auto path = write_file("conf/client.conf",
        "tls.server_name = localhost\n"
        "tls.ca = ../pki/ca.pem\n"
    );
    auto c = tls_config::load(path.string());
    ASSERT_TRUE(c.has_value()) << to_string(c.error());
    EXPECT_EQ(c->ca_file_path, path_util::normalize(dir / "pki" / "ca.pem").string());
}

TEST_F(config_fixture, contexts_from_config_files){
    const test_identity& id = test_identity_for_localhost();
    write_file("pki/ca.pem", id.ca_pem);
    write_file("pki/leaf.pem", id.cert_pem);
    write_file("pki/leaf.key", id.key_pem);

    auto server_path = write_file("server.conf",
        "tls.role = server\n"
        "tls.cert = pki/leaf.pem\n"
        "tls.key = pki/leaf.key\n"
        "tls.min_version = 1.3\n"
        "tls.early_data = on\n"
    );
    auto client_path = write_file("client.conf",
        "tls.server_name = localhost\n"
        "tls.ca = pki/ca.pem\n"
        "tls.early_data = on\n"
    );

    auto server_cfg = tls_config::load(server_path.string());
    auto client_cfg = tls_config::load(client_path.string());
    ASSERT_TRUE(server_cfg.has_value());
    ASSERT_TRUE(client_cfg.has_value());

    auto server = tls_context::create(*server_cfg);
    ASSERT_TRUE(server.has_value()) << to_string(server.error());
    EXPECT_TRUE(server->is_server());
    EXPECT_TRUE(server->early_data_enabled());
    EXPECT_EQ(server->sessions(), nullptr);

    auto client = tls_context::create(*client_cfg);
    ASSERT_TRUE(client.has_value()) << to_string(client.error());
    EXPECT_FALSE(client->is_server());
    EXPECT_NE(client->sessions(), nullptr);
}

TEST_F(config_fixture, missing_ca_file_fails_context){
    auto path = write_file("client.conf",
        "tls.server_name = localhost\n"
        "tls.ca = absent.pem\n"
    );
    auto cfg = tls_config::load(path.string());
    ASSERT_TRUE(cfg.has_value());
    auto ctx = tls_context::create(*cfg);
    ASSERT_FALSE(ctx.has_value());
    EXPECT_EQ(tls::kind_of(ctx.error().code), tls::tls_error::ca_load_failed);
}
