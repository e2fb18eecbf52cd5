// ╺┳╸┏━┓┏━┓┏━╸
//  ┃ ┣━┫┣━┛┣╸
//  ╹ ╹ ╹╹  ┗━╸
//  Tree Adaptation via Path Expressions
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 the tape authors
#pragma once

// Everything needed to adapt a source tree: load a Definition, build an
// Adapter from it and call convert_tree()
#include "tape/adapter.hh"
#include "tape/cli.hh"
#include "tape/definition.hh"
#include "tape/document.hh"
#include "tape/errors.hh"
#include "tape/extraction.hh"
#include "tape/library.hh"
#include "tape/node.hh"
#include "tape/path.hh"
#include "tape/value.hh"
