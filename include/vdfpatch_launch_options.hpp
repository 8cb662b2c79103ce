// vdfpatch_launch_options.hpp - vdfpatch - Launch option catalog
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef VDFPATCH_LAUNCH_OPTIONS_HPP
#define VDFPATCH_LAUNCH_OPTIONS_HPP

#include "vdfpatch_core.hpp"
#include "vdfpatch_escape.hpp"

namespace vdfpatch
{
    struct launch_option
    {
        std::string key;
        std::string name;
        std::string description;
        std::string command;
        std::string category;
        std::string compatibility;
        std::string requirements;
    };

    // Catalog in presentation order. RDNA3 variants follow the base
    // entries; MangoHUD entries are dropped on request.
    std::vector<launch_option> launch_option_catalog(bool rdna3_workaround = false, bool include_mangohud = true);

    std::optional<launch_option> find_launch_option(std::vector<launch_option> const & catalog, std::string_view key);

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        constexpr std::string_view DLL_OVERRIDE = "WINEDLLOVERRIDES=\"dxgi=n,b\"";
        constexpr std::string_view RDNA3_CONFIG = "DXIL_SPIRV_CONFIG=wmma_rdna3_workaround";

        inline launch_option rdna3_variant(launch_option const & base)
        {
            std::string cmd = base.command;
            replace_all(cmd, DLL_OVERRIDE, std::string(DLL_OVERRIDE) + " " + std::string(RDNA3_CONFIG));

            if (cmd.find("RADV_PERFTEST=") == std::string::npos)
                replace_all(cmd, "PROTON_FSR4_UPGRADE=1", "PROTON_FSR4_UPGRADE=1 RADV_PERFTEST=nggc");
            else
                replace_all(cmd, "RADV_PERFTEST=", "RADV_PERFTEST=nggc,");

            return launch_option{
                base.key + "_rdna3",
                base.name + " (RDNA3)",
                base.description + " - RDNA3 GPU workaround",
                cmd,
                base.category,
                "RDNA3 GPUs only",
                base.requirements + ", RDNA3 GPU"
            };
        }

        inline std::vector<launch_option> base_catalog()
        {
            std::string const base(DLL_OVERRIDE);
            std::string const mango = "mangohud ";
            std::string const nofg  = "WINEDLLOVERRIDES=\"dxgi=n,b;nvngx=n,b\" PROTON_FSR4_UPGRADE=1 %command%";
            std::string const adv   = " PROTON_FSR4_UPGRADE=1 DXVK_ASYNC=1 PROTON_ENABLE_NVAPI=1 PROTON_HIDE_NVIDIA_GPU=0"
                                      " VKD3D_CONFIG=dxr11,dxr WINE_CPU_TOPOLOGY=4:2 %command%";

            return {
                { "basic", "Basic OptiScaler",
                  "Essential OptiScaler setup - recommended starting point",
                  base + " PROTON_FSR4_UPGRADE=1 %command%",
                  "basic", "All games", "OptiScaler installed" },
                { "basic_mangohud", "Basic + MangoHUD",
                  "Basic OptiScaler with performance monitoring overlay",
                  mango + base + " PROTON_FSR4_UPGRADE=1 %command%",
                  "basic", "All games", "OptiScaler installed, MangoHUD" },
                { "advanced", "Advanced OptiScaler",
                  "Enhanced performance and compatibility settings",
                  base + adv,
                  "advanced", "Most games", "OptiScaler installed, DXVK" },
                { "advanced_mangohud", "Advanced + MangoHUD",
                  "Advanced settings with performance monitoring",
                  mango + base + adv,
                  "advanced", "Most games", "OptiScaler installed, DXVK, MangoHUD" },
                { "debug", "Debug Mode",
                  "Detailed logging for troubleshooting issues",
                  base + " PROTON_LOG=+all WINEDEBUG=+dll PROTON_FSR4_UPGRADE=1 %command%",
                  "debug", "All games", "OptiScaler installed" },
                { "debug_mangohud", "Debug + MangoHUD",
                  "Debug mode with performance monitoring",
                  mango + base + " PROTON_LOG=+all WINEDEBUG=+dll PROTON_FSR4_UPGRADE=1 %command%",
                  "debug", "All games", "OptiScaler installed, MangoHUD" },
                { "antilag", "Anti-Lag 2",
                  "Experimental latency reduction (AMD only)",
                  base + " PROTON_FSR4_UPGRADE=1 RADV_PERFTEST=rt %command%",
                  "experimental", "AMD GPUs only", "OptiScaler installed, AMD GPU" },
                { "antilag_mangohud", "Anti-Lag 2 + MangoHUD",
                  "Anti-Lag 2 with performance monitoring",
                  mango + base + " PROTON_FSR4_UPGRADE=1 RADV_PERFTEST=rt %command%",
                  "experimental", "AMD GPUs only", "OptiScaler installed, AMD GPU, MangoHUD" },
                { "fsr4_enhanced", "FSR4 Enhanced",
                  "Optimized FSR4 settings with enhanced performance",
                  base + " PROTON_FSR4_UPGRADE=1 RADV_PERFTEST=nggc,rt %command%",
                  "fsr4", "AMD GPUs (FSR4 capable)", "OptiScaler installed, AMD GPU, FSR4 DLL" },
                { "fsr4_enhanced_mangohud", "FSR4 Enhanced + MangoHUD",
                  "FSR4 Enhanced with performance monitoring",
                  mango + base + " PROTON_FSR4_UPGRADE=1 RADV_PERFTEST=nggc,rt %command%",
                  "fsr4", "AMD GPUs (FSR4 capable)", "OptiScaler installed, AMD GPU, FSR4 DLL, MangoHUD" },
                { "ue_dx12", "Unreal Engine + DX12",
                  "Optimized for Unreal Engine games with DirectX 12",
                  base + " PROTON_FSR4_UPGRADE=1 -dx12 %command%",
                  "game_specific", "Unreal Engine games", "OptiScaler installed, UE game" },
                { "ue_dx12_mangohud", "Unreal Engine + DX12 + MangoHUD",
                  "UE DX12 optimization with performance monitoring",
                  mango + base + " PROTON_FSR4_UPGRADE=1 -dx12 %command%",
                  "game_specific", "Unreal Engine games", "OptiScaler installed, UE game, MangoHUD" },
                { "no_dlss_fg", "Disable DLSS Frame Generation",
                  "For games with DLSS Frame Generation issues",
                  nofg,
                  "compatibility", "Games with DLSS FG issues", "OptiScaler installed" },
                { "no_dlss_fg_mangohud", "Disable DLSS FG + MangoHUD",
                  "DLSS FG disabled with performance monitoring",
                  mango + nofg,
                  "compatibility", "Games with DLSS FG issues", "OptiScaler installed, MangoHUD" },
            };
        }
    }

//========================================================================
// Catalog API implementation
//========================================================================

    inline std::vector<launch_option> launch_option_catalog(bool rdna3_workaround, bool include_mangohud)
    {
        std::vector<launch_option> catalog = detail::base_catalog();

        if (rdna3_workaround)
        {
            std::vector<launch_option> variants;
            for (auto const & opt : catalog)
            {
                if (opt.command.find(detail::RDNA3_CONFIG) == std::string::npos)
                    variants.push_back(detail::rdna3_variant(opt));
            }
            catalog.insert(catalog.end(), variants.begin(), variants.end());
        }

        if (!include_mangohud)
        {
            std::erase_if(catalog, [](launch_option const & opt) {
                return opt.key.find("mangohud") != std::string::npos;
            });
        }

        return catalog;
    }

    inline std::optional<launch_option> find_launch_option(std::vector<launch_option> const & catalog, std::string_view key)
    {
        auto it = std::find_if(catalog.begin(), catalog.end(),
                               [&](launch_option const & opt) { return opt.key == key; });
        if (it == catalog.end())
            return std::nullopt;
        return *it;
    }

} // namespace vdfpatch

#endif // VDFPATCH_LAUNCH_OPTIONS_HPP
