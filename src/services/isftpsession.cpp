/**
 * @file isftpsession.cpp
 * @brief MOC compilation unit for ISftpSession interface.
 *
 * This file exists solely to ensure Qt's MOC processes the ISftpSession
 * header and generates the necessary meta-object code for the signals.
 */

#include "isftpsession.h"
