/**
 * @file protocolconnector.cpp
 * @brief Implementation file for the ProtocolConnector interface.
 *
 * The interface is pure virtual, but its signals need a translation unit
 * for MOC-generated code.
 */

#include "protocolconnector.h"
