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


#include "BufferBase.hpp"

#include "GraphicsAccessories.hpp"

namespace Bindery
{

#define LOG_BUFFER_ERROR_AND_THROW(...) LOG_ERROR_AND_THROW("Description of buffer '", (Desc.Name ? Desc.Name : ""), "' is invalid: ", ##__VA_ARGS__)
#define VERIFY_BUFFER(Expr, ...)                     \
    do                                               \
    {                                                \
        if (!(Expr))                                 \
        {                                            \
            LOG_BUFFER_ERROR_AND_THROW(__VA_ARGS__); \
        }                                            \
    } while (false)


void ValidateBufferDesc(const BufferDesc& Desc) noexcept(false)
{
    static_assert(BIND_FLAG_LAST == 0x8, "Please update this function to handle the new bind flags");

    constexpr Uint32 AllowedBindFlags =
        BIND_UNIFORM_BUFFER |
        BIND_SHADER_RESOURCE |
        BIND_UNORDERED_ACCESS |
        BIND_INDIRECT_DRAW_ARGS;

    VERIFY_BUFFER((Desc.BindFlags & ~AllowedBindFlags) == 0, "the following bind flags are not allowed for a buffer: ", GetBindFlagsString(Desc.BindFlags & ~AllowedBindFlags, ", "), '.');

    VERIFY_BUFFER(Desc.Size != 0, "buffer size must not be zero.");
    VERIFY_BUFFER(Desc.ElementByteStride != 0, "element stride must not be zero.");
    VERIFY_BUFFER(Desc.Size % Desc.ElementByteStride == 0, "buffer size (", Desc.Size, ") is not a multiple of the element stride (", Desc.ElementByteStride, ").");
    VERIFY_BUFFER(Desc.ElementByteStride % 4 == 0, "element stride (", Desc.ElementByteStride, ") must be a multiple of 4.");
    VERIFY_BUFFER(Desc.ComputeType < COMPUTE_BUFFER_TYPE_NUM_TYPES, "compute buffer type (", Uint32{Desc.ComputeType}, ") is invalid.");

    if ((Desc.BindFlags & BIND_UNORDERED_ACCESS) ||
        (Desc.BindFlags & BIND_SHADER_RESOURCE))
    {
        VERIFY_BUFFER(Desc.Mode > BUFFER_MODE_UNDEFINED && Desc.Mode < BUFFER_MODE_NUM_MODES, GetBufferModeString(Desc.Mode),
                      " is not a valid mode for a buffer created with BIND_SHADER_RESOURCE or BIND_UNORDERED_ACCESS flags.");
    }

    if (Desc.ComputeType == COMPUTE_BUFFER_TYPE_CONSTANT)
    {
        VERIFY_BUFFER((Desc.BindFlags & BIND_UNIFORM_BUFFER) != 0, "constant buffers must be created with BIND_UNIFORM_BUFFER flag.");
    }
    else if (Desc.ComputeType == COMPUTE_BUFFER_TYPE_INDIRECT_ARGUMENTS)
    {
        VERIFY_BUFFER((Desc.BindFlags & BIND_INDIRECT_DRAW_ARGS) != 0, "indirect argument buffers must be created with BIND_INDIRECT_DRAW_ARGS flag.");
    }
    else if (Desc.ComputeType == COMPUTE_BUFFER_TYPE_RAW)
    {
        VERIFY_BUFFER(Desc.Mode == BUFFER_MODE_RAW, "raw compute buffers must use BUFFER_MODE_RAW.");
    }
}

void ValidateBufferInitData(const BufferDesc& Desc, const BufferData* pBuffData) noexcept(false)
{
    if (pBuffData == nullptr || pBuffData->pData == nullptr)
        return;

    VERIFY_BUFFER(pBuffData->DataSize <= Desc.Size, "initial data size (", pBuffData->DataSize, ") exceeds the buffer size (", Desc.Size, ").");
}

#undef VERIFY_BUFFER
#undef LOG_BUFFER_ERROR_AND_THROW


bool VerifyUpdateBufferParams(const BufferDesc& Desc, Uint64 Offset, Uint64 Size, const void* pData)
{
#define VERIFY_UPDATE_BUFFER(Expr, ...)                                                                          \
    do                                                                                                           \
    {                                                                                                            \
        if (!(Expr))                                                                                             \
        {                                                                                                        \
            LOG_ERROR_MESSAGE("Update buffer command for buffer '", Desc.Name, "' is invalid: ", ##__VA_ARGS__); \
            return false;                                                                                        \
        }                                                                                                        \
    } while (false)

    VERIFY_UPDATE_BUFFER(pData != nullptr || Size == 0, "pData must not be null.");
    VERIFY_UPDATE_BUFFER(Offset < Desc.Size || (Offset == Desc.Size && Size == 0), "offset (", Offset, ") exceeds the buffer size (", Desc.Size, ").");
    VERIFY_UPDATE_BUFFER(Size <= Desc.Size - Offset, "update region [", Offset, ",", Offset + Size, ") is out of buffer bounds [0,", Desc.Size, ").");
#undef VERIFY_UPDATE_BUFFER

    return true;
}

} // namespace Bindery
