// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <spinalg/data/settings.hpp>
#include <spinalg/data/spin_matrices.hpp>
#include <spinalg/data/spin_operator.hpp>
#include <spinalg/data/spin_term.hpp>
#include <spinalg/utils/logger.hpp>
