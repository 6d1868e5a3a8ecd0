// Copyright 2026 Global Phasing Ltd.

#ifndef CIFMILL_VERSION_HPP_
#define CIFMILL_VERSION_HPP_
#define CIFMILL_VERSION "0.1.0"
#endif
