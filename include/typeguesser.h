/**
 * @file typeguesser.h
 * @brief typeguesser - incremental column type and size inference.
 * @version 0.1.0
 *
 * Main public header. Feed values to a Guesser, one at a time or in bulk,
 * and read back the narrowest storage type and size able to hold them all.
 */

#ifndef TYPEGUESSER_H
#define TYPEGUESSER_H

#define TYPEGUESSER_VERSION_MAJOR 0
#define TYPEGUESSER_VERSION_MINOR 1
#define TYPEGUESSER_VERSION_PATCH 0
#define TYPEGUESSER_VERSION_STRING "0.1.0"

#include "typeguesser/bulk.h"
#include "typeguesser/culture.h"
#include "typeguesser/database_type_request.h"
#include "typeguesser/debug.h"
#include "typeguesser/decider.h"
#include "typeguesser/deciders.h"
#include "typeguesser/error.h"
#include "typeguesser/guesser.h"
#include "typeguesser/guesser_pool.h"
#include "typeguesser/registry.h"
#include "typeguesser/settings.h"
#include "typeguesser/size.h"
#include "typeguesser/types.h"

#endif // TYPEGUESSER_H
