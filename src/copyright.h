// -*-c++-*-
#ifndef MDSCAN_COPYRIGHT_H
#define MDSCAN_COPYRIGHT_H

//-------------------------------------------------------------------------------------------------
// mdscan: trajectory iteration and structural superposition for molecular dynamics analysis
//
// Copyright the mdscan developers.  Distributed under the MIT license.  See LICENSE for the full
// text.
//-------------------------------------------------------------------------------------------------

#endif
