#ifndef VPNCORE_EXPORT_MACRO_HPP
#define VPNCORE_EXPORT_MACRO_HPP

#if defined _WIN32 || defined __CYGWIN__
#ifdef BUILDING_VPNCORE
#define VPNCORE_EXPORT __declspec(dllexport)
#else
#define VPNCORE_EXPORT __declspec(dllimport)
#endif
#else
#if __GNUC__ >= 4
#define VPNCORE_EXPORT __attribute__((visibility("default")))
#else
#define VPNCORE_EXPORT
#endif
#endif

#endif
