#include "ward/cli.hpp"
#include "ward/config.hpp"
#include "ward/entitlements.hpp"
#include "ward/hardware_fingerprint.hpp"
#include "ward/key_manager.hpp"
#include "ward/license_issuer.hpp"
#include "ward/offline_verifier.hpp"
#include "ward/revocation_list.hpp"
#include "ward/revocation_server.hpp"
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace ward::cli
{
	namespace
	{
		constexpr int kExitOk = 0;
		constexpr int kExitError = 1;
		constexpr int kExitDenied = 2;

		int fail(const WardError &error)
		{
			std::cerr << error.what() << std::endl;
			return kExitError;
		}

		Result<WardConfig> load_config(const std::string &path)
		{
			if (!path.empty())
				return ConfigLoader::load(path);
			if (std::filesystem::exists("ward.toml"))
				return ConfigLoader::load("ward.toml");
			return ConfigLoader::defaults();
		}

		Result<std::shared_ptr<AuditLog>> open_audit(const WardConfig &cfg)
		{
			if (!cfg.audit.key)
			{
				return std::unexpected(WardError::config("No audit key: set [audit] key or WARD_AUDIT_KEY"));
			}
			return std::make_shared<AuditLog>(cfg.audit.log_path, *cfg.audit.key);
		}

		Result<std::shared_ptr<crypto::KeyStore>> open_keys(const WardConfig &cfg, const crypto::AESKey &storage_key)
		{
			auto store = std::make_shared<crypto::KeyStore>(cfg.keys.bits);
			if (auto loaded = store->load_from_directory(cfg.keys.dir, storage_key); !loaded)
				return std::unexpected(loaded.error());
			return store;
		}

		Result<void> write_output(const std::string &out_path, const std::string &content)
		{
			if (out_path.empty())
			{
				std::cout << content << std::endl;
				return {};
			}
			std::ofstream out(out_path);
			if (!out.is_open())
				return std::unexpected(WardError::io("Unable to open output file: " + out_path));
			out << content << '\n';
			if (!out)
				return std::unexpected(WardError::io("Failed writing " + out_path));
			return {};
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"ward offline license issuance and verification"};
		app.require_subcommand(1);

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML (default ./ward.toml if present)");

		auto cfg_cmd = app.add_subcommand("config-print", "Print the effective configuration as JSON");

		// keys
		auto keys_cmd = app.add_subcommand("keys", "Manage issuing keys");
		keys_cmd->require_subcommand(1);
		auto keys_init = keys_cmd->add_subcommand("init", "Create the first issuing key");
		auto keys_rotate = keys_cmd->add_subcommand("rotate", "Generate and publish the next key version");

		uint32_t export_version{0};
		std::string export_format{"pem"};
		std::string export_out;
		auto keys_export = keys_cmd->add_subcommand("export", "Export a public key");
		keys_export->add_option("--version", export_version, "Key version (default current)");
		keys_export->add_option("--format", export_format, "pem, der or xml")
			->check(CLI::IsMember({"pem", "der", "xml"}));
		keys_export->add_option("--out", export_out, "Output file (defaults to stdout)");

		bool self_test_ephemeral{false};
		auto keys_self_test = keys_cmd->add_subcommand("self-test", "Check every key's encodings against each other");
		keys_self_test->add_flag("--ephemeral", self_test_ephemeral, "Test a freshly generated key instead of the key store");

		std::string ring_out;
		auto keys_ring = keys_cmd->add_subcommand("ring", "Write the public key ring for verifiers");
		keys_ring->add_option("--out", ring_out, "Output file (defaults to stdout)");

		// issue
		std::string issue_tier;
		int64_t issue_days{0};
		bool issue_perpetual{false};
		std::string issue_fingerprint;
		std::string issue_out;
		auto issue_cmd = app.add_subcommand("issue", "Issue a signed license");
		issue_cmd->add_option("--tier", issue_tier, "basic, workplace, gamer, ai_dev, gamer_ai or server")->required();
		auto days_opt = issue_cmd->add_option("--days", issue_days, "Validity in days");
		auto perpetual_opt = issue_cmd->add_flag("--perpetual", issue_perpetual, "No expiry");
		days_opt->excludes(perpetual_opt);
		issue_cmd->add_option("--fingerprint", issue_fingerprint, "Bind to this hardware fingerprint");
		issue_cmd->add_option("--out", issue_out, "License file path (defaults to stdout)");

		// verify
		std::string verify_license;
		std::string verify_ring;
		std::string verify_fingerprint;
		UnixSeconds verify_now{0};
		bool verify_offline{false};
		auto verify_cmd = app.add_subcommand("verify", "Verify a license file on this machine");
		verify_cmd->add_option("--license", verify_license, "License file")->required();
		verify_cmd->add_option("--ring", verify_ring, "Public key ring file")->required();
		verify_cmd->add_option("--fingerprint", verify_fingerprint, "Override the local hardware fingerprint");
		verify_cmd->add_option("--now", verify_now, "Override the local clock (unix seconds)");
		verify_cmd->add_flag("--offline", verify_offline, "Skip the online revocation check");

		auto fp_cmd = app.add_subcommand("fingerprint", "Print this machine's hardware fingerprint");

		std::string revoke_serial;
		std::string revoke_reason;
		auto revoke_cmd = app.add_subcommand("revoke", "Revoke a license serial");
		revoke_cmd->add_option("--serial", revoke_serial, "License serial (the two middle key groups, no dash)")->required();
		revoke_cmd->add_option("--reason", revoke_reason, "Free-text reason recorded in the audit log");

		auto audit_cmd = app.add_subcommand("audit-verify", "Recompute the audit log hash chain");

		std::optional<std::uint16_t> serve_port;
		std::optional<std::size_t> serve_threads;
		auto serve_cmd = app.add_subcommand("serve", "Run the revocation HTTP server");
		serve_cmd->add_option("--port", serve_port, "Port to bind");
		serve_cmd->add_option("--threads", serve_threads, "Number of worker threads");

		CLI11_PARSE(app, argc, argv);

		auto cfg = load_config(config_path);
		if (!cfg)
			return fail(cfg.error());
		if (auto logging = ConfigLoader::apply_logging(*cfg); !logging)
			return fail(logging.error());

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return kExitOk;
		}

		if (*fp_cmd)
		{
			auto fp = HardwareFingerprinter().fingerprint();
			if (!fp)
				return fail(fp.error());
			std::cout << *fp << std::endl;
			return kExitOk;
		}

		if (*keys_self_test && self_test_ephemeral)
		{
			auto key = crypto::KeyManager::generate_keypair(1, cfg->keys.bits);
			if (!key)
				return fail(key.error());
			if (auto tested = crypto::KeyManager::self_test(*key); !tested)
				return fail(tested.error());
			std::cout << "Key encodings agree (ephemeral key, " << key->public_key.bits() << " bits)" << std::endl;
			return kExitOk;
		}

		if (*audit_cmd)
		{
			auto audit = open_audit(*cfg);
			if (!audit)
				return fail(audit.error());
			auto report = (*audit)->verify_chain();
			if (!report)
				return fail(report.error());
			nlohmann::json out{{"valid", report->valid}, {"entries", report->entries}};
			if (report->first_invalid)
			{
				out["first_invalid"] = *report->first_invalid;
				out["reason"] = report->reason;
			}
			std::cout << out.dump(2) << std::endl;
			return report->valid ? kExitOk : kExitDenied;
		}

		if (*revoke_cmd)
		{
			auto audit = open_audit(*cfg);
			if (!audit)
				return fail(audit.error());
			RevocationList list(cfg->revocation.list_path, *audit);
			if (auto loaded = list.load(); !loaded)
				return fail(loaded.error());
			if (auto revoked = list.revoke(revoke_serial, revoke_reason); !revoked)
				return fail(revoked.error());
			std::cout << "Revoked " << revoke_serial << std::endl;
			return kExitOk;
		}

		if (*serve_cmd)
		{
			auto list = std::make_shared<RevocationList>(cfg->revocation.list_path);
			if (auto loaded = list->load(); !loaded)
				return fail(loaded.error());

			RevocationServerConfig rsc;
			rsc.address = cfg->server.address;
			rsc.port = serve_port.value_or(cfg->server.port);
			rsc.threads = serve_threads.value_or(cfg->server.threads);
			rsc.rate_limit.tokens_per_second = cfg->server.rps;
			rsc.rate_limit.burst_capacity = cfg->server.burst;
			rsc.revocations = list;
			try
			{
				RevocationServer server(rsc);
				server.run();
			}
			catch (const std::exception &e)
			{
				spdlog::error("Revocation server failed: {}", e.what());
				return kExitError;
			}
			return kExitOk;
		}

		if (*verify_cmd)
		{
			auto audit = open_audit(*cfg);
			if (!audit)
				return fail(audit.error());
			auto license = LicenseFile::load(verify_license);
			if (!license)
				return fail(license.error());
			auto ring = crypto::PublicKeyRing::load(verify_ring);
			if (!ring)
				return fail(ring.error());

			std::string fingerprint = verify_fingerprint;
			if (fingerprint.empty())
			{
				auto fp = HardwareFingerprinter().fingerprint();
				if (!fp)
					return fail(fp.error());
				fingerprint = *fp;
			}

			VerifierConfig vc;
			vc.audit = *audit;
			vc.cache = std::make_shared<ValidationCache>(cfg->cache.path, fingerprint);
			vc.clock_skew_seconds = cfg->cache.clock_skew_seconds;
			vc.grace_period_seconds = cfg->cache.grace_days * 86400;
			if (!verify_offline && !cfg->revocation.endpoint.empty())
			{
				auto endpoint = Endpoint::parse(cfg->revocation.endpoint);
				if (!endpoint)
					return fail(endpoint.error());
				auto transport = std::make_shared<HttpRevocationTransport>(
					*endpoint, std::chrono::milliseconds(cfg->revocation.timeout_ms));
				vc.reconciler = std::make_shared<OnlineReconciler>(transport, vc.cache, vc.clock_skew_seconds);
			}

			OfflineVerifier verifier(vc);
			auto result = verifier.verify(*license, *ring, verify_now ? verify_now : unix_now(), fingerprint);
			if (!result)
				return fail(result.error());

			nlohmann::json out{{"status", status_to_string(result->status)},
							   {"message", result->message},
							   {"serial", result->serial}};
			if (result->tier)
			{
				out["tier"] = tier_to_string(*result->tier);
				out["entitlements"] = result->entitlements;
			}
			if (result->expires_at)
				out["expires_at"] = to_iso8601(*result->expires_at);
			std::cout << out.dump(2) << std::endl;
			return result->valid() ? kExitOk : kExitDenied;
		}

		// Remaining commands need the issuing keys.
		auto storage_key = crypto::KeyManager::get_encryption_key();
		if (!storage_key)
			return fail(storage_key.error());

		if (*keys_init)
		{
			if (std::filesystem::exists(std::filesystem::path(cfg->keys.dir) / crypto::KeyManager::key_filename(1)))
			{
				return fail(WardError(ErrorCode::AlreadyExists, "Key store already initialized in " + cfg->keys.dir));
			}
			crypto::KeyStore store(cfg->keys.bits);
			auto version = store.rotate();
			if (!version)
				return fail(version.error());
			if (auto saved = store.save_key(cfg->keys.dir, *storage_key, *version); !saved)
				return fail(saved.error());
			std::cout << "Created key version " << *version << " in " << cfg->keys.dir << std::endl;
			return kExitOk;
		}

		auto keys = open_keys(*cfg, *storage_key);
		if (!keys)
			return fail(keys.error());

		if (*keys_rotate)
		{
			auto version = (*keys)->rotate();
			if (!version)
				return fail(version.error());
			if (auto saved = (*keys)->save_key(cfg->keys.dir, *storage_key, *version); !saved)
				return fail(saved.error());
			std::cout << "Current key version is now " << *version << std::endl;
			return kExitOk;
		}

		if (*keys_self_test)
		{
			if (auto tested = crypto::KeyManager::verify_key_store(**keys); !tested)
				return fail(tested.error());
			std::cout << "All " << (*keys)->key_versions().size() << " key versions passed" << std::endl;
			return kExitOk;
		}

		if (*keys_export)
		{
			auto encoding = crypto::encoding_from_string(export_format);
			if (!encoding)
				return fail(encoding.error());
			uint32_t version = export_version ? export_version : (*keys)->current_version();
			auto exported = (*keys)->export_public(version, *encoding);
			if (!exported)
				return fail(exported.error());
			if (auto written = write_output(export_out, *exported); !written)
				return fail(written.error());
			return kExitOk;
		}

		if (*keys_ring)
		{
			auto ring = (*keys)->public_key_ring(cfg->keys.retain);
			if (!ring)
				return fail(ring.error());
			if (ring_out.empty())
			{
				auto j = ring->to_json();
				if (!j)
					return fail(j.error());
				std::cout << j->dump(2) << std::endl;
				return kExitOk;
			}
			if (auto saved = ring->save(ring_out); !saved)
				return fail(saved.error());
			return kExitOk;
		}

		if (*issue_cmd)
		{
			if (!*days_opt && !issue_perpetual)
			{
				return fail(WardError::invalid_input("Pass --days N or --perpetual"));
			}
			auto audit = open_audit(*cfg);
			if (!audit)
				return fail(audit.error());
			auto ledger = std::make_shared<IssuanceLedger>(cfg->issuance.ledger_path);
			if (auto loaded = ledger->load(); !loaded)
				return fail(loaded.error());

			LicenseIssuer issuer(*keys, ledger, *audit);
			std::optional<std::string> binding;
			if (!issue_fingerprint.empty())
				binding = issue_fingerprint;
			auto window = issue_perpetual ? ValidityWindow::perpetual() : ValidityWindow::days(issue_days);

			auto issued = issuer.issue(issue_tier, window, binding);
			if (!issued)
				return fail(issued.error());

			if (issue_out.empty())
			{
				std::cout << issued->file().to_json().dump(2) << std::endl;
			}
			else
			{
				if (auto saved = issued->file().save(issue_out); !saved)
					return fail(saved.error());
				std::cout << issued->key_string << std::endl;
			}
			return kExitOk;
		}

		std::cout << app.help() << std::endl;
		return kExitOk;
	}

} // namespace ward::cli
