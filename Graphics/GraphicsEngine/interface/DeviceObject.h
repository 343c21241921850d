/*
 *  Copyright 2024 Diligent Graphics LLC
 *
 *  Licensed under the Apache License, Version 2.0 (the "License");
 *  you may not use this file except in compliance with the License.
 *  You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 *  Unless required by applicable law or agreed to in writing, software
 *  distributed under the License is distributed on an "AS IS" BASIS,
 *  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *  See the License for the specific language governing permissions and
 *  limitations under the License.
 *
 *  In no event and under no legal theory, whether in tort (including negligence),
 *  contract, or otherwise, unless required by applicable law (such as deliberate
 *  and grossly negligent acts) or agreed to in writing, shall any Contributor be
 *  liable for any damages, including any direct, indirect, special, incidental,
 *  or consequential damages of any character arising as a result of this License or
 *  out of the use or inability to use the software (including but not limited to damages
 *  for loss of goodwill, work stoppage, computer failure or malfunction, or any and
 *  all other commercial damages or losses), even if such Contributor has been advised
 *  of the possibility of such damages.
 */


#pragma once

/// \file
/// Defines Bindery::IDeviceObject interface

#include "../../../Primitives/interface/Object.h"
#include "GraphicsTypes.h"

namespace Bindery
{

// {5B4CCA0B-5075-4230-9759-F48769EE5502}
static constexpr INTERFACE_ID IID_DeviceObject =
    {0x5b4cca0b, 0x5075, 0x4230, {0x97, 0x59, 0xf4, 0x87, 0x69, 0xee, 0x55, 0x2}};

/// Base interface for all objects created by the render device Bindery::IRenderDevice
class IDeviceObject : public IObject
{
public:
    /// Returns the object description
    virtual const DeviceObjectAttribs& GetDesc() const = 0;

    /// Returns unique identifier assigned to an object

    /// \remarks Unique identifiers can be used to reliably check if two objects are identical.
    ///          A released object may be followed by another object at the same address,
    ///          so pointer comparisons are not reliable.
    ///
    ///          Valid identifiers are always positive values.
    virtual Int32 GetUniqueID() const = 0;
};

} // namespace Bindery
