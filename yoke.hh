// ╻ ╻┏━┓╻┏ ┏━╸
// ┗┳┛┃ ┃┣┻┓┣╸ 
//  ╹ ┗━┛╹ ╹┗━╸
//  YAML Operator Knob Expressions
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Tagged scalars such as
//
//   gain: !7 "0.5 * axis[1] + (toggle[0] and 0.2)"
//
// are compiled at load time and bound to the live input provider named by
// the tag. The resolved tree re-evaluates them against fresh input samples
// every time a concrete value is needed.

#include "common.hh"
#include "errors.hh"
#include "sample.hh"
#include "expression.hh"
#include "tree.hh"
#include "resolver.hh"
#include "cli.hh"
