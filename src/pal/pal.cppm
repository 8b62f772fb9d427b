export module pal;

export import :Chunk;
export import :Compiler;
export import :Config;
export import :Debug;
export import :Diagnostics;
export import :EnumFormatter;
export import :exits;
export import :Lexer;
export import :Natives;
export import :Object;
export import :ObjectFwd;
export import :OpCode;
export import :RuntimeError;
export import :SourceLocation;
export import :Stack;
export import :Token;
export import :Value;
export import :VirtualMachine;
