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
/// Implementation of the Bindery::BufferBase template class

#include "Buffer.h"
#include "DeviceObjectBase.hpp"

namespace Bindery
{

/// Validates buffer description and throws an exception in case of an error.
void ValidateBufferDesc(const BufferDesc& Desc) noexcept(false);

/// Validates initial buffer data parameters and throws an exception in case of an error.
void ValidateBufferInitData(const BufferDesc& Desc, const BufferData* pBuffData) noexcept(false);

/// Validates update buffer command parameters.
bool VerifyUpdateBufferParams(const BufferDesc& Desc, Uint64 Offset, Uint64 Size, const void* pData);


/// Template class implementing base functionality of the buffer object

/// \tparam BaseInterface        - Base interface that this class will inherit (IBuffer or IBufferHost).
/// \tparam RenderDeviceImplType - Type of the render device implementation.
template <class BaseInterface, class RenderDeviceImplType>
class BufferBase : public DeviceObjectBase<BaseInterface, RenderDeviceImplType, BufferDesc>
{
public:
    using TDeviceObjectBase = DeviceObjectBase<BaseInterface, RenderDeviceImplType, BufferDesc>;

    /// \param pDevice  - Pointer to the device.
    /// \param BuffDesc - Buffer description.
    BufferBase(RenderDeviceImplType* pDevice,
               const BufferDesc&     BuffDesc) :
        TDeviceObjectBase{pDevice, BuffDesc}
    {
        ValidateBufferDesc(this->m_Desc);
    }

    IMPLEMENT_QUERY_INTERFACE_IN_PLACE(IID_Buffer, TDeviceObjectBase)
};

} // namespace Bindery
