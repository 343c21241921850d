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
/// Helper functions that upload host data to GPU buffers

#include <vector>
#include <cstring>

#include "../../GraphicsEngine/interface/DeviceContext.h"
#include "../../../Primitives/interface/Errors.hpp"

namespace Bindery
{

/// Uploads Count elements to the beginning of the buffer.

/// \param[in] pContext - Device context. An immediate context writes the data right away,
///                       a deferred context records the write into its command list.
/// \param[in] pBuffer  - Destination buffer.
/// \param[in] pData    - Elements to upload.
/// \param[in] Count    - Number of elements. Nothing is uploaded or recorded if Count is zero.
template <typename DataType>
void PushBufferData(IDeviceContext* pContext, IBuffer* pBuffer, const DataType* pData, size_t Count)
{
    if (Count == 0)
        return;

    const Uint64 DataSize = Uint64{sizeof(DataType)} * Count;
    DEV_CHECK_ERR(DataSize <= pBuffer->GetDesc().Size, "Uploaded data (", DataSize, " bytes) does not fit into buffer '",
                  pBuffer->GetDesc().Name, "' (", pBuffer->GetDesc().Size, " bytes)");
    pContext->UpdateBuffer(pBuffer, 0, DataSize, pData);
}

template <typename DataType>
void PushBufferData(IDeviceContext* pContext, IBuffer* pBuffer, const std::vector<DataType>& Data)
{
    PushBufferData(pContext, pBuffer, Data.data(), Data.size());
}

/// Uploads a single value to a constant buffer.

/// The value is copied into a temporary allocation of one buffer element,
/// padded with zeros, which is released once the update has been submitted.
///
/// \remarks std::runtime_error is thrown if the value does not fit into one element.
template <typename DataType>
void PushConstantData(IDeviceContext* pContext, IBuffer* pBuffer, const DataType& Value)
{
    const auto& Desc = pBuffer->GetDesc();
    if (sizeof(DataType) > Desc.ElementByteStride)
    {
        LOG_ERROR_AND_THROW("Constant data (", sizeof(DataType), " bytes) is larger than the element stride of buffer '",
                            Desc.Name, "' (", Desc.ElementByteStride, " bytes)");
    }

    std::vector<Uint8> StagingData(Desc.ElementByteStride);
    std::memcpy(StagingData.data(), &Value, sizeof(DataType));
    pContext->UpdateBuffer(pBuffer, 0, StagingData.size(), StagingData.data());
}

} // namespace Bindery
