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


#include "BufferHostImpl.hpp"

#include <cstring>
#include <new>

namespace Bindery
{

BufferHostImpl::BufferHostImpl(RenderDeviceHostImpl* pDevice,
                               const BufferDesc&     BuffDesc,
                               const BufferData*     pBuffData) :
    TBufferBase{pDevice, BuffDesc}
{
    ValidateBufferInitData(m_Desc, pBuffData);

    if (m_Desc.Size > m_Data.max_size())
    {
        LOG_ERROR_AND_THROW("Buffer '", (m_Desc.Name != nullptr ? m_Desc.Name : ""), "' requires ", m_Desc.Size,
                            " bytes, which exceeds the maximum host allocation size (", m_Data.max_size(), " bytes)");
    }

    m_pDevice->AllocateDeviceMemory(m_Desc.Size, m_Desc.Name);
    try
    {
        m_Data.resize(static_cast<size_t>(m_Desc.Size));
    }
    catch (...)
    {
        // Return the reservation before the error propagates
        m_pDevice->FreeDeviceMemory(m_Desc.Size);
        throw;
    }

    if (pBuffData != nullptr && pBuffData->pData != nullptr && pBuffData->DataSize != 0)
        memcpy(m_Data.data(), pBuffData->pData, static_cast<size_t>(pBuffData->DataSize));

    m_IsValid = true;
    m_pDevice->OnCreateBuffer(this);
}

BufferHostImpl::~BufferHostImpl()
{
    if (m_IsValid)
        m_pDevice->FreeDeviceMemory(m_Desc.Size);
    m_pDevice->OnDestroyBuffer(this);
}

void BufferHostImpl::Update(Uint64 Offset, Uint64 Size, const void* pData)
{
    VERIFY(Offset + Size <= m_Desc.Size, "Update region is out of buffer bounds");
    if (!m_IsValid)
    {
        LOG_ERROR_MESSAGE("Unable to update buffer '", m_Desc.Name, "': the buffer storage has been lost");
        return;
    }
    if (Size != 0)
        memcpy(m_Data.data() + Offset, pData, static_cast<size_t>(Size));
}

void BufferHostImpl::Invalidate()
{
    if (!m_IsValid)
        return;

    m_IsValid = false;
    std::vector<Uint8>{}.swap(m_Data);
    m_pDevice->FreeDeviceMemory(m_Desc.Size);
}

} // namespace Bindery
