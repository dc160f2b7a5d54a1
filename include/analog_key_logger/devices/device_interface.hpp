/**
 * @file device_interface.hpp
 * @license License BSD-3-Clause
 * @copyright Copyright (c) 2019, New York University and Max Planck
 * Gesellschaft.
 * @date 2019-07-11
 */

#pragma once

/**
 * @brief This namespace is the standard namespace of the package.
 */
namespace analog_key_logger
{
/**
 * @brief this class exists purely for logical reasons, it does not in
 * itself implement anything.
 *
 * the purpose of this class is to provide guidelines how a device should
 * be implemented. a device is brought up once, sampled any number of times
 * and released once. generally, we expect the following functions to be
 * implemented:
 * - an initialize() function which acquires the native resources and
 * reports the identity of the device it found.
 * - a sampling function returning one snapshot of the device outputs,
 * stamped with the time it was taken.
 * - a shutdown() function which releases everything initialize() acquired.
 * it has to be safe to call after a failed initialize() and more than
 * once.
 */
class DeviceInterface
{
};

}  // namespace analog_key_logger
