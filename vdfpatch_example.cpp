// vdfpatch_example.cpp - Set a Steam game's launch options with vdfpatch
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#include "include/vdfpatch.hpp"
#include "include/vdfpatch_steam.hpp"
#include "include/vdfpatch_launch_options.hpp"
#include <iostream>
#include <iomanip>

using namespace vdfpatch;

namespace
{
    struct arguments
    {
        std::optional<std::filesystem::path> file;
        std::string app_id;
        std::optional<std::string> option_key;
        std::optional<std::string> raw_value;
        bool rdna3       = false;
        bool mangohud    = true;
        bool list        = false;
        bool dry_run     = false;
        bool verbose     = false;
        bool no_signal   = false;
    };

    void usage(char const * argv0)
    {
        std::cout
            << "usage: " << argv0 << " [options] <app_id> (--option <key> | --raw <value>)\n"
            << "       " << argv0 << " --list [--rdna3] [--no-mangohud]\n\n"
            << "  --file <path>    localconfig.vdf to patch (default: discovered)\n"
            << "  --option <key>   launch option from the catalog\n"
            << "  --raw <value>    literal launch options string\n"
            << "  --rdna3          include RDNA3 workaround variants\n"
            << "  --no-mangohud    hide MangoHUD variants\n"
            << "  --list           print the catalog and exit\n"
            << "  --dry-run        print the patched record, write nothing\n"
            << "  --no-signal      do not signal a running Steam process\n"
            << "  --verbose        debug logging\n";
    }

    std::optional<arguments> parse_arguments(int argc, char ** argv)
    {
        arguments args;

        for (int i = 1; i < argc; ++i)
        {
            std::string a = argv[i];
            auto next = [&]() -> std::optional<std::string> {
                if (i + 1 >= argc)
                {
                    std::cerr << a << " needs a value\n";
                    return std::nullopt;
                }
                return std::string(argv[++i]);
            };

            if (a == "--file")             { auto v = next(); if (!v) return std::nullopt; args.file = *v; }
            else if (a == "--option")      { auto v = next(); if (!v) return std::nullopt; args.option_key = *v; }
            else if (a == "--raw")         { auto v = next(); if (!v) return std::nullopt; args.raw_value = *v; }
            else if (a == "--rdna3")       args.rdna3 = true;
            else if (a == "--no-mangohud") args.mangohud = false;
            else if (a == "--list")        args.list = true;
            else if (a == "--dry-run")     args.dry_run = true;
            else if (a == "--no-signal")   args.no_signal = true;
            else if (a == "--verbose")     args.verbose = true;
            else if (a.starts_with("--"))
            {
                std::cerr << "unknown option " << a << "\n";
                return std::nullopt;
            }
            else if (args.app_id.empty())  args.app_id = a;
            else
            {
                std::cerr << "unexpected argument " << a << "\n";
                return std::nullopt;
            }
        }

        return args;
    }

    void print_catalog(std::vector<launch_option> const & catalog)
    {
        std::string category;
        for (auto const & opt : catalog)
        {
            if (opt.category != category)
            {
                category = opt.category;
                std::cout << "\n[" << category << "]\n";
            }
            std::cout << "  " << std::left << std::setw(28) << opt.key << opt.name << "\n"
                      << "  " << std::setw(28) << "" << opt.command << "\n";
        }
    }

    void print_result(patch_result const & res)
    {
        std::cout << "status:  " << detail::to_string(res.status) << "\n";
        if (res.status != patch_status::unchanged)
            std::cout << "action:  " << (res.was_insert ? "inserted" : "replaced") << "\n";
        if (res.backup_path)
            std::cout << "backup:  " << res.backup_path->string() << "\n";
        if (res.diagnostic)
            std::cout << "error:   " << detail::to_string(res.diagnostic->kind) << ": " << res.diagnostic->message << "\n";
        for (auto const & w : res.warnings)
            std::cout << "warning: " << w.message << "\n";
        for (auto const & n : res.notes)
            std::cout << "note:    " << n << "\n";
    }
}

int main(int argc, char ** argv)
{
    auto args = parse_arguments(argc, argv);
    if (!args)
    {
        usage(argv[0]);
        return 2;
    }

    vdfpatch::log::set_level(args->verbose ? vdfpatch::log::level::debug : vdfpatch::log::level::warn);

    auto catalog = launch_option_catalog(args->rdna3, args->mangohud);

    if (args->list)
    {
        print_catalog(catalog);
        return 0;
    }

    if (args->app_id.empty() || args->option_key.has_value() == args->raw_value.has_value())
    {
        usage(argv[0]);
        return 2;
    }

    std::string value;
    if (args->option_key)
    {
        auto opt = find_launch_option(catalog, *args->option_key);
        if (!opt)
        {
            std::cerr << "no launch option '" << *args->option_key << "' (see --list)\n";
            return 2;
        }
        value = opt->command;
    }
    else
    {
        value = *args->raw_value;
    }

    std::filesystem::path file;
    if (args->file)
    {
        file = *args->file;
    }
    else
    {
        auto root = steam::find_steam_root();
        auto config = root ? steam::find_localconfig(*root) : std::nullopt;
        if (!config)
        {
            std::cerr << "could not find localconfig.vdf; pass --file\n";
            return 1;
        }
        file = *config;
    }

    patch_request req;
    req.record_path   = steam::app_record_path(args->app_id);
    req.field_name    = std::string(steam::LAUNCH_OPTIONS_FIELD);
    req.desired_value = value;

    if (args->dry_run)
    {
        std::error_code ec;
        auto text = read_document(file, ec);
        if (!text)
        {
            std::cerr << "cannot read " << file.string() << ": " << ec.message() << "\n";
            return 1;
        }

        auto preview = preview_patch(*text, req);
        if (is_error(preview))
        {
            std::cerr << get_error(preview).message << "\n";
            return 1;
        }

        auto const & p = get_patch(preview);
        if (p.previous_value)
            std::cout << "old: " << *p.previous_value << "\n";
        std::cout << "new: " << value << "\n\n";

        size_t end = p.record.end + p.text.size() - text->size();
        std::cout << "{" << std::string_view(p.text).substr(p.record.start, end - p.record.start) << "}\n";
        return 0;
    }

    patch_options opts;
    opts.owner_hint = args->no_signal ? std::string() : std::string(steam::OWNER_PROCESS);

    auto res = apply_patch(file, req, opts);
    print_result(res);

    return res.success ? 0 : 1;
}
