//
// Arbor.hh
//
// Copyright 2018-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#ifndef _ARBOR_HH
#define _ARBOR_HH

#include "arbor/Hash.hh"
#include "arbor/Aggregators.hh"
#include "arbor/Config.hh"
#include "arbor/Location.hh"
#include "arbor/Stash.hh"
#include "arbor/Tree.hh"
#include "arbor/Collections.hh"

#endif // _ARBOR_HH
