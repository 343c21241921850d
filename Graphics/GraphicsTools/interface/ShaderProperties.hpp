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
/// Shader property identifiers and field initialization tables

#include <unordered_set>

#include "../../GraphicsEngine/interface/GraphicsTypes.h"
#include "../../../Primitives/interface/Errors.hpp"

namespace Bindery
{

/// Returns the identifier of the shader property with the given name.

/// The first call for a name assigns it a new identifier. All subsequent calls
/// return the same identifier for the lifetime of the process.
/// The function is thread-safe.
ShaderPropertyID GetShaderPropertyID(const Char* Name) noexcept(false);

/// Returns the name of the shader property, or null if the identifier has not been assigned.
const Char* GetShaderPropertyName(ShaderPropertyID ID);


/// Describes one field of a structure: its name and the pointer to the member.
template <typename StructType, typename FieldType>
struct StructField
{
    const Char* Name = nullptr;

    FieldType StructType::*Member = nullptr;
};

template <typename StructType>
using ShaderPropertyField = StructField<StructType, ShaderPropertyID>;


/// Calls Visit(Index, Field) for every field in the table.
template <typename StructType, typename FieldType, typename VisitorType>
void EnumerateFields(const StructField<StructType, FieldType>* pFields, size_t NumFields, VisitorType&& Visit)
{
    for (size_t i = 0; i < NumFields; ++i)
        Visit(i, pFields[i]);
}

/// Sets every field of Data listed in the table to Construct(Name).

/// Throws std::runtime_error if a field name is null, or if a name or a member
/// is listed more than once.
template <typename StructType, typename FieldType, typename ConstructorType>
void InitializeStructFields(StructType&                              Data,
                            const StructField<StructType, FieldType>* pFields,
                            size_t                                    NumFields,
                            ConstructorType&&                         Construct) noexcept(false)
{
    std::unordered_set<String> Names;
    for (size_t i = 0; i < NumFields; ++i)
    {
        const auto& Field = pFields[i];
        if (Field.Name == nullptr || Field.Member == nullptr)
            LOG_ERROR_AND_THROW("Field ", i, " has no name or member pointer");

        if (!Names.insert(Field.Name).second)
            LOG_ERROR_AND_THROW("Field '", Field.Name, "' is listed more than once");

        for (size_t j = 0; j < i; ++j)
        {
            if (pFields[j].Member == Field.Member)
                LOG_ERROR_AND_THROW("Fields '", pFields[j].Name, "' and '", Field.Name, "' refer to the same member");
        }
    }

    EnumerateFields(pFields, NumFields,
                    [&](size_t, const StructField<StructType, FieldType>& Field) {
                        Data.*Field.Member = Construct(Field.Name);
                    });
}

/// Initializes a structure of shader property identifiers from its field table.

/// Every member of the structure must be a ShaderPropertyID listed in the table;
/// a table that does not cover the structure fails to compile.
///
/// \code
///     struct SimulationProps
///     {
///         ShaderPropertyID Positions;
///         ShaderPropertyID Velocities;
///     };
///     static constexpr ShaderPropertyField<SimulationProps> SimulationPropFields[] =
///     {
///         {"_Positions",  &SimulationProps::Positions},
///         {"_Velocities", &SimulationProps::Velocities},
///     };
///     SimulationProps Props;
///     InitializeShaderProperties(Props, SimulationPropFields);
/// \endcode
template <typename StructType, size_t NumFields>
void InitializeShaderProperties(StructType& Props, const ShaderPropertyField<StructType> (&Fields)[NumFields]) noexcept(false)
{
    static_assert(sizeof(StructType) == sizeof(ShaderPropertyID) * NumFields,
                  "Every member of the structure must be listed in the field table");
    InitializeStructFields(Props, Fields, NumFields, GetShaderPropertyID);
}

} // namespace Bindery
