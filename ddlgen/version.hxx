// file      : ddlgen/version.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_VERSION_HXX
#define DDLGEN_VERSION_HXX

// Version format is AABBCCDD where
//
// AA - major version number
// BB - minor version number
// CC - bugfix version number
// DD - alpha / beta (DD + 50) version number
//
// When DD is not 00, 1 is subtracted from AABBCC. For example:
//
// Version     AABBCCDD
// 1.0.0       01000000
// 1.1.0       01010000
// 1.1.1       01010100
// 1.2.0.a1    01019901
//
#define DDLGEN_VERSION     1000000
#define DDLGEN_VERSION_STR "1.0.0"

#endif // DDLGEN_VERSION_HXX
